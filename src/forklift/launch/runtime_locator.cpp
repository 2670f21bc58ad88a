#include "forklift/launch/runtime_locator.hpp"

#include <array>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <system_error>

namespace forklift::launch {

namespace {

using common::OsFamily;

struct StrategyEntry {
  OsFamily family;
  RuntimeStrategy strategy;
};

// First matching family wins.
constexpr std::array<StrategyEntry, 3> kStrategyTable = {{
    {OsFamily::kNetware, {"java", HomeProbe::kNone}},
    {OsFamily::kWindows, {"java.exe", HomeProbe::kSiblingBin}},
    {OsFamily::kDos, {"java.exe", HomeProbe::kSiblingBin}},
}};

constexpr RuntimeStrategy kDefaultStrategy = {"java", HomeProbe::kSiblingBin};

auto NonEmptyEnv(const char* name) -> const char* {
  const char* value = std::getenv(name);
  if (value == nullptr || *value == '\0') {
    return nullptr;
  }
  return value;
}

}  // namespace

auto SelectRuntimeStrategy(const common::OsFamilyClassifier& classifier)
    -> RuntimeStrategy {
  for (const auto& entry : kStrategyTable) {
    if (classifier.IsFamily(entry.family)) {
      return entry.strategy;
    }
  }
  return kDefaultStrategy;
}

auto DefaultRuntimeHome() -> std::filesystem::path {
  if (const char* home = NonEmptyEnv("FORKLIFT_RUNTIME_HOME")) {
    return home;
  }
  return {};
}

auto RuntimeLocator::ResolveRuntimeExecutable() const -> std::string {
  namespace fs = std::filesystem;

  RuntimeStrategy strategy = SelectRuntimeStrategy(*classifier_);
  if (strategy.probe == HomeProbe::kNone || home_.empty()) {
    return std::string(kBareRuntimeCommand);
  }

  // The reported home is not reliable on every platform, so a miss falls
  // back to PATH lookup instead of failing.
  fs::path candidate = home_ / ".." / "bin" / strategy.base_name;
  std::error_code ec;
  if (!fs::is_regular_file(candidate, ec)) {
    return std::string(kBareRuntimeCommand);
  }
  // The home may be a symlink, so ".." must be resolved on the real path.
  fs::path resolved = fs::weakly_canonical(candidate, ec);
  if (ec) {
    return std::string(kBareRuntimeCommand);
  }
  return resolved.string();
}

}  // namespace forklift::launch
