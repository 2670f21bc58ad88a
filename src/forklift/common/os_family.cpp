#include "forklift/common/os_family.hpp"

namespace forklift::common {

auto ToString(OsFamily family) -> const char* {
  switch (family) {
    case OsFamily::kWindows:
      return "windows";
    case OsFamily::kDos:
      return "dos";
    case OsFamily::kNetware:
      return "netware";
    case OsFamily::kOs2:
      return "os/2";
    case OsFamily::kMac:
      return "mac";
    case OsFamily::kUnix:
      return "unix";
  }
  return "unknown";
}

auto HostOsClassifier::IsFamily(OsFamily family) const -> bool {
  switch (family) {
    case OsFamily::kWindows:
    case OsFamily::kDos:
#if defined(_WIN32)
      return true;
#else
      return false;
#endif
    case OsFamily::kNetware:
    case OsFamily::kOs2:
      return false;
    case OsFamily::kMac:
#if defined(__APPLE__)
      return true;
#else
      return false;
#endif
    case OsFamily::kUnix:
#if defined(__unix__) || defined(__APPLE__)
      return true;
#else
      return false;
#endif
  }
  return false;
}

auto HostClassifier() -> const OsFamilyClassifier& {
  static const HostOsClassifier kHost;
  return kHost;
}

}  // namespace forklift::common
