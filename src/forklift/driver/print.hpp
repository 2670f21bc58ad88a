#pragma once

#include <string>

#include "forklift/common/diagnostic.hpp"

namespace forklift::driver {

void PrintError(const std::string& message);
void PrintWarning(const std::string& message);
void PrintDiagnostic(const Diagnostic& diag);

}  // namespace forklift::driver
