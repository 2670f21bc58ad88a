#include "forklift/common/launch_error.hpp"

#include <exception>
#include <string>

#include <fmt/core.h>

namespace forklift {

auto FormatErrorChain(const LaunchError& error) -> std::string {
  std::string out = error.what();
  std::exception_ptr cause = error.Cause();
  while (cause != nullptr) {
    try {
      std::rethrow_exception(cause);
    } catch (const LaunchError& e) {
      out += fmt::format("\n  caused by: {}", e.what());
      cause = e.Cause();
    } catch (const std::exception& e) {
      out += fmt::format("\n  caused by: {}", e.what());
      cause = nullptr;
    } catch (...) {
      out += "\n  caused by: unknown exception";
      cause = nullptr;
    }
  }
  return out;
}

}  // namespace forklift
