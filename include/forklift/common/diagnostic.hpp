#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <utility>
#include <vector>

namespace forklift {

enum class DiagKind : uint8_t {
  kError,      // Invalid user input (bad value in a config file)
  kHostError,  // I/O, malformed external input
  kWarning,    // Non-fatal
  kNote,       // Auxiliary message
};

struct DiagItem {
  DiagKind kind;
  std::string message;

  auto operator==(const DiagItem&) const -> bool = default;
};

// Primary message plus optional notes. Used for errors in files the user
// hands to the driver; launch failures are exceptions (launch_error.hpp).
struct Diagnostic {
  DiagItem primary;
  std::vector<DiagItem> notes;

  auto operator==(const Diagnostic&) const -> bool = default;

  static auto Error(std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary = {.kind = DiagKind::kError, .message = std::move(msg)},
        .notes = {},
    };
  }

  static auto HostError(std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary = {.kind = DiagKind::kHostError, .message = std::move(msg)},
        .notes = {},
    };
  }

  auto WithNote(std::string msg) && -> Diagnostic {
    notes.push_back(
        DiagItem{
            .kind = DiagKind::kNote,
            .message = std::move(msg),
        });
    return std::move(*this);
  }
};

template <typename T>
using Result = std::expected<T, Diagnostic>;

}  // namespace forklift
