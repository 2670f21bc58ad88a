#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace forklift::launch {

using ArgumentList = std::vector<std::string>;

// Signature every unit exports as its entry point.
using EntryPointFn = void (*)(const ArgumentList& args);

inline constexpr std::string_view kEntrySymbolPrefix = "forklift_main_";

// File suffix of a unit inside a class path directory.
inline constexpr std::string_view kUnitFileSuffix = ".so";

// Exported symbol of a unit's entry point: the prefix followed by the unit
// name with every character outside [A-Za-z0-9_] replaced by '_'.
//   "demo.Hello" -> "forklift_main_demo_Hello"
auto EntrySymbolName(std::string_view unit_name) -> std::string;

// Location of a unit relative to a class path directory.
//   "demo.Hello" -> "demo/Hello.so"
auto UnitRelativePath(std::string_view unit_name) -> std::filesystem::path;

}  // namespace forklift::launch

// A unit is any library that exports the entry symbol with C linkage:
//
//   extern "C" void forklift_main_demo_Hello(
//       const std::vector<std::string>& args) { ... }
//
// FORKLIFT_ENTRY_POINT writes that definition for an existing function.
// `unit` is the unit name already in symbol form (dots written as
// underscores):
//
//   void Run(const forklift::launch::ArgumentList& args);
//   FORKLIFT_ENTRY_POINT(demo_Hello, Run)
//
// Anything thrown by `function` reaches the launcher as the cause of a
// TargetExecutionError.
#define FORKLIFT_ENTRY_POINT(unit, function)                               \
  extern "C" __attribute__((visibility("default"))) void                   \
      forklift_main_##unit(const ::forklift::launch::ArgumentList& args) { \
    function(args);                                                        \
  }
