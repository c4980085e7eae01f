#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace smartuuid::codegen {

enum class Severity : std::uint8_t {
  kError,    // generation stops; the build fails
  kWarning,  // reported, generation continues
};

// Diagnostic is attached to a location inside the manifest, expressed as a
// JSON pointer (RFC 6901), e.g. "/declarations/0/cases/2/attributes/uuid_type/prfx".
// An empty pointer designates the whole document.
struct Diagnostic {
  Severity severity{Severity::kError};  // NOLINT(readability-identifier-naming)
  std::string pointer;                  // NOLINT(readability-identifier-naming)
  std::string message;                  // NOLINT(readability-identifier-naming)

  bool operator==(const Diagnostic&) const = default;
};

using Diagnostics = std::vector<Diagnostic>;

[[nodiscard]] Diagnostic make_error(std::string pointer, std::string message);
[[nodiscard]] Diagnostic make_warning(std::string pointer, std::string message);

// format_diagnostic renders "<source>:<pointer>: error: <message>".
// The pointer is rendered as "/" when empty.
[[nodiscard]] std::string format_diagnostic(const Diagnostic& diagnostic,
                                            std::string_view source_name);

// JSON pointer helpers. Tokens are escaped per RFC 6901 ('~' -> "~0", '/' -> "~1").
[[nodiscard]] std::string pointer_append(std::string_view base, std::string_view token);
[[nodiscard]] std::string pointer_append(std::string_view base, std::size_t index);

}  // namespace smartuuid::codegen
