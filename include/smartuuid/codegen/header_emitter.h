#pragma once

#include "smartuuid/codegen/descriptor_builder.h"

#include <string>
#include <string_view>

namespace smartuuid::codegen {

// emit_header renders a self-contained C++20 header for a DescriptorSet:
// - an `enum class NAME : std::uint8_t` per descriptor, enumerators valued 0..n-1,
//   placed in the manifest's namespace
// - a smartuuid::category_traits<NAME> specialization with kTypeName, kCount,
//   discriminant, from_discriminant and prefix
//
// Every type in the emitted traits is fully qualified, so the header does not
// depend on using-directives at the include site.
// Output is deterministic: same input produces byte-identical text.
[[nodiscard]] std::string emit_header(const DescriptorSet& set, std::string_view source_name);

// cpp_string_literal quotes text as a C++ narrow string literal, escaping
// '"', '\\' and non-printable bytes.
[[nodiscard]] std::string cpp_string_literal(std::string_view text);

}  // namespace smartuuid::codegen
