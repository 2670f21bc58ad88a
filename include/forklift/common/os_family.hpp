#pragma once

#include <cstdint>
#include <initializer_list>
#include <set>

namespace forklift::common {

// Operating-system families the launcher distinguishes. A host may belong
// to several (Windows is both kWindows and kDos).
enum class OsFamily : uint8_t {
  kWindows,
  kDos,
  kNetware,
  kOs2,
  kMac,
  kUnix,
};

auto ToString(OsFamily family) -> const char*;

class OsFamilyClassifier {
 public:
  OsFamilyClassifier() = default;
  virtual ~OsFamilyClassifier() = default;

  OsFamilyClassifier(const OsFamilyClassifier&) = delete;
  auto operator=(const OsFamilyClassifier&) -> OsFamilyClassifier& = delete;
  OsFamilyClassifier(OsFamilyClassifier&&) = delete;
  auto operator=(OsFamilyClassifier&&) -> OsFamilyClassifier& = delete;

  [[nodiscard]] virtual auto IsFamily(OsFamily family) const -> bool = 0;
};

// Classifies the platform this binary was compiled for.
class HostOsClassifier final : public OsFamilyClassifier {
 public:
  [[nodiscard]] auto IsFamily(OsFamily family) const -> bool override;
};

// Answers from an explicit family set. Lets callers plan a launch for a
// platform other than the host, and lets tests pin the platform.
class FixedOsClassifier final : public OsFamilyClassifier {
 public:
  explicit FixedOsClassifier(std::initializer_list<OsFamily> families)
      : families_(families) {
  }

  [[nodiscard]] auto IsFamily(OsFamily family) const -> bool override {
    return families_.contains(family);
  }

 private:
  std::set<OsFamily> families_;
};

// Process-wide host classifier.
auto HostClassifier() -> const OsFamilyClassifier&;

}  // namespace forklift::common
