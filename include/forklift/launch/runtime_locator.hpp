#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>

#include "forklift/common/os_family.hpp"

namespace forklift::launch {

// Command name used when no runtime binary can be located. Resolved through
// PATH when the child is started.
inline constexpr std::string_view kBareRuntimeCommand = "java";

enum class HomeProbe : uint8_t {
  kNone,        // Never look at the filesystem
  kSiblingBin,  // <home>/../bin/<base name>
};

struct RuntimeStrategy {
  std::string_view base_name;
  HomeProbe probe;

  auto operator==(const RuntimeStrategy&) const -> bool = default;
};

// Strategy for the platform described by the classifier. NetWare is never
// probed: a runtime may sit in its JRE directory but is not the one to use.
auto SelectRuntimeStrategy(const common::OsFamilyClassifier& classifier)
    -> RuntimeStrategy;

// Runtime home from FORKLIFT_RUNTIME_HOME. This is the nested home whose
// parent holds bin/ (a JDK's jre/ directory), not the JDK root that
// JAVA_HOME usually names. Empty if unset.
auto DefaultRuntimeHome() -> std::filesystem::path;

// Determines the default runtime executable for forked launches.
class RuntimeLocator {
 public:
  RuntimeLocator(
      const common::OsFamilyClassifier& classifier,
      std::filesystem::path home)
      : classifier_(&classifier), home_(std::move(home)) {
  }

  // Absolute path of the probed binary if it exists, otherwise the bare
  // command name. Never fails: a wrong or missing home falls back to PATH
  // lookup at execution time.
  [[nodiscard]] auto ResolveRuntimeExecutable() const -> std::string;

  [[nodiscard]] auto Home() const -> const std::filesystem::path& {
    return home_;
  }

 private:
  const common::OsFamilyClassifier* classifier_;
  std::filesystem::path home_;
};

}  // namespace forklift::launch
