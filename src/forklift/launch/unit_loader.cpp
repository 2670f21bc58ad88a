#include "forklift/launch/unit_loader.hpp"

#include <dlfcn.h>

#include <exception>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "forklift/common/launch_error.hpp"

namespace forklift::launch {

namespace fs = std::filesystem;

namespace {

auto LastDlError() -> std::string {
  const char* error = dlerror();
  return error != nullptr ? std::string(error) : std::string("unknown error");
}

// Units run arbitrary code; an exception they throw may outlive the loader
// that opened them, so their code must stay mapped after dlclose.
constexpr int kOpenFlags = RTLD_NOW | RTLD_LOCAL | RTLD_NODELETE;

}  // namespace

auto SharedLibrary::Open(const fs::path& path) -> SharedLibrary {
  void* handle = dlopen(path.c_str(), kOpenFlags);
  if (handle == nullptr) {
    throw LoadError(
        fmt::format("cannot open library '{}'", path.string()),
        std::make_exception_ptr(std::runtime_error(LastDlError())));
  }
  return SharedLibrary(handle, path);
}

SharedLibrary::~SharedLibrary() {
  if (handle_ != nullptr) {
    dlclose(handle_);
  }
}

SharedLibrary::SharedLibrary(SharedLibrary&& other) noexcept
    : handle_(std::exchange(other.handle_, nullptr)),
      path_(std::move(other.path_)) {
}

auto SharedLibrary::operator=(SharedLibrary&& other) noexcept
    -> SharedLibrary& {
  if (this != &other) {
    if (handle_ != nullptr) {
      dlclose(handle_);
    }
    handle_ = std::exchange(other.handle_, nullptr);
    path_ = std::move(other.path_);
  }
  return *this;
}

auto SharedLibrary::FindSymbol(const std::string& name) const -> void* {
  if (handle_ == nullptr) {
    return nullptr;
  }
  return dlsym(handle_, name.c_str());
}

UnitLoader::UnitLoader(std::vector<fs::path> search_path)
    : search_path_(std::move(search_path)) {
}

auto UnitLoader::OpenLibrary(const fs::path& path) -> const SharedLibrary& {
  for (const auto& library : libraries_) {
    if (library.Path() == path) {
      return library;
    }
  }
  libraries_.push_back(SharedLibrary::Open(path));
  return libraries_.back();
}

auto UnitLoader::Resolve(std::string_view unit_name) -> ResolvedUnit {
  const std::string symbol = EntrySymbolName(unit_name);
  const fs::path relative = UnitRelativePath(unit_name);

  for (const auto& entry : search_path_) {
    std::error_code ec;
    if (fs::is_directory(entry, ec)) {
      fs::path candidate = entry / relative;
      if (!fs::is_regular_file(candidate, ec)) {
        continue;
      }
      const SharedLibrary& library = OpenLibrary(candidate);
      // The unit's own library decides: a missing symbol here is a unit
      // without an entry point, not a reason to keep searching.
      return ResolvedUnit{
          .source = candidate,
          .entry = reinterpret_cast<EntryPointFn>(library.FindSymbol(symbol)),
      };
    }
    if (fs::is_regular_file(entry, ec)) {
      const SharedLibrary& library = OpenLibrary(entry);
      if (void* address = library.FindSymbol(symbol)) {
        return ResolvedUnit{
            .source = entry,
            .entry = reinterpret_cast<EntryPointFn>(address),
        };
      }
    }
  }

  std::string searched;
  for (const auto& entry : search_path_) {
    searched += fmt::format("\n  - {}", entry.string());
  }
  throw LoadError(
      fmt::format(
          "no library provides '{}' ({} or symbol {}); searched:{}", unit_name,
          relative.string(), symbol, searched));
}

auto ResolveAmbientUnit(std::string_view unit_name) -> ResolvedUnit {
  const std::string symbol = EntrySymbolName(unit_name);
  dlerror();
  void* address = dlsym(RTLD_DEFAULT, symbol.c_str());
  if (address == nullptr) {
    throw LoadError(
        fmt::format(
            "symbol {} is not loaded in this process (set a class path to "
            "load '{}' from a library)",
            symbol, unit_name));
  }
  return ResolvedUnit{
      .source = {},
      .entry = reinterpret_cast<EntryPointFn>(address),
  };
}

}  // namespace forklift::launch
