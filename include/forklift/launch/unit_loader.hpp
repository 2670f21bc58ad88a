#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "forklift/launch/entry_point.hpp"

namespace forklift::launch {

// Owning handle to a dlopen'ed library. Opened RTLD_LOCAL, so its symbols
// are only reachable through this handle.
class SharedLibrary {
 public:
  // Throws LoadError with the dlerror() text as cause.
  static auto Open(const std::filesystem::path& path) -> SharedLibrary;

  ~SharedLibrary();

  SharedLibrary(const SharedLibrary&) = delete;
  auto operator=(const SharedLibrary&) -> SharedLibrary& = delete;
  SharedLibrary(SharedLibrary&& other) noexcept;
  auto operator=(SharedLibrary&& other) noexcept -> SharedLibrary&;

  // nullptr if the library does not export `name`.
  [[nodiscard]] auto FindSymbol(const std::string& name) const -> void*;

  [[nodiscard]] auto Path() const -> const std::filesystem::path& {
    return path_;
  }

 private:
  SharedLibrary(void* handle, std::filesystem::path path)
      : handle_(handle), path_(std::move(path)) {
  }

  void* handle_ = nullptr;
  std::filesystem::path path_;
};

struct ResolvedUnit {
  // Library the unit was found in; empty for units already in the process.
  std::filesystem::path source;
  // nullptr when the unit was located but exports no entry point.
  EntryPointFn entry = nullptr;
};

// Resolves units against an explicit, ordered search path. Every library it
// opens belongs to this loader alone and is closed when it is destroyed.
//
// Search path entries:
//   - directory: <dir>/<UnitRelativePath(name)> is the unit's library
//   - file: a library that may hold any number of units
//   - missing: skipped
class UnitLoader {
 public:
  explicit UnitLoader(std::vector<std::filesystem::path> search_path);

  // Throws LoadError if the unit is not found or a library fails to open.
  auto Resolve(std::string_view unit_name) -> ResolvedUnit;

  [[nodiscard]] auto SearchPath() const
      -> const std::vector<std::filesystem::path>& {
    return search_path_;
  }

 private:
  auto OpenLibrary(const std::filesystem::path& path) -> const SharedLibrary&;

  std::vector<std::filesystem::path> search_path_;
  std::vector<SharedLibrary> libraries_;
};

// Resolves a unit among the symbols already loaded into the process (the
// executable and its global-scope libraries). Throws LoadError if absent.
auto ResolveAmbientUnit(std::string_view unit_name) -> ResolvedUnit;

}  // namespace forklift::launch
