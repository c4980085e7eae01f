#include "smartuuid/codegen/diagnostic.h"

namespace smartuuid::codegen {

Diagnostic make_error(std::string pointer, std::string message) {
  return Diagnostic{Severity::kError, std::move(pointer), std::move(message)};
}

Diagnostic make_warning(std::string pointer, std::string message) {
  return Diagnostic{Severity::kWarning, std::move(pointer), std::move(message)};
}

std::string format_diagnostic(const Diagnostic& diagnostic, const std::string_view source_name) {
  std::string out{source_name};
  out += ':';
  out += diagnostic.pointer.empty() ? std::string{"/"} : diagnostic.pointer;
  out += diagnostic.severity == Severity::kError ? ": error: " : ": warning: ";
  out += diagnostic.message;
  return out;
}

std::string pointer_append(const std::string_view base, const std::string_view token) {
  std::string out{base};
  out.reserve(base.size() + token.size() + 1);
  out += '/';
  for (const char ch : token) {
    if (ch == '~') {
      out += "~0";
    } else if (ch == '/') {
      out += "~1";
    } else {
      out += ch;
    }
  }
  return out;
}

std::string pointer_append(const std::string_view base, const std::size_t index) {
  return pointer_append(base, std::to_string(index));
}

}  // namespace smartuuid::codegen
