#pragma once

#include "smartuuid/codegen/diagnostic.h"
#include "smartuuid/codegen/manifest.h"
#include "smartuuid/core/result.h"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace smartuuid::codegen {

// ResolvedCase is a category with its final discriminant and prefix.
struct ResolvedCase {
  std::string name;            // NOLINT(readability-identifier-naming)
  std::uint8_t discriminant{};  // NOLINT(readability-identifier-naming)
  std::string prefix;          // NOLINT(readability-identifier-naming)
  bool custom_prefix{false};   // true when set by uuid_type(prefix = ...)
  std::string pointer;         // NOLINT(readability-identifier-naming)
};

// CategoryDescriptor is everything the emitter needs for one category set.
struct CategoryDescriptor {
  std::string name;                 // NOLINT(readability-identifier-naming)
  std::string type_name;            // qualified, without leading "::" (e.g. "acme::ids::UserType")
  std::vector<ResolvedCase> cases;  // discriminant == index
};

struct DescriptorSet {
  std::string name_space;                      // NOLINT(readability-identifier-naming)
  std::vector<CategoryDescriptor> descriptors;  // NOLINT(readability-identifier-naming)
  Diagnostics warnings;                        // NOLINT(readability-identifier-naming)
};

// build_descriptor derives the descriptor of one declaration.
//
// Rules:
// - kind must be "enum"; every case must be unit-shaped; 1..256 cases
// - discriminants follow declaration order: 0, 1, 2, ...
// - prefix = uuid_type(prefix = "...") when present, to_snake_case(name) otherwise
// - inside uuid_type, "prefix" is the only accepted key
//
// Returns the first error found, located by JSON pointer.
[[nodiscard]] core::Result<CategoryDescriptor, Diagnostic> build_descriptor(
    const CategoryDecl& decl, std::string_view name_space);

// find_prefix_collisions reports cases sharing a prefix as warnings.
// Collisions are legal but make the prefixed text form ambiguous to readers.
[[nodiscard]] Diagnostics find_prefix_collisions(const CategoryDescriptor& descriptor);

// build_descriptors derives every declaration of a manifest.
// Collects one error per failing declaration; warnings travel with the result.
[[nodiscard]] core::Result<DescriptorSet, Diagnostics> build_descriptors(const Manifest& manifest);

// is_identifier: [A-Za-z_][A-Za-z0-9_]*, excluding C++ keywords and reserved names
// ("__" anywhere, or '_' followed by an uppercase letter).
[[nodiscard]] bool is_identifier(std::string_view name);

// is_namespace_path: empty, or identifiers joined by "::"
[[nodiscard]] bool is_namespace_path(std::string_view path);

}  // namespace smartuuid::codegen
