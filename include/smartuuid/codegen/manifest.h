#pragma once

#include "smartuuid/codegen/diagnostic.h"
#include "smartuuid/core/result.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace smartuuid::codegen {

// Shape of one declared case. Only kUnit cases can become categories.
enum class CaseShape : std::uint8_t {
  kUnit,    // no "fields" member
  kTuple,   // "fields": [...]
  kRecord,  // "fields": {...}
};

// CaseDecl is one case of a declaration, exactly as written in the manifest.
// The uuid_type attribute is kept unparsed; build_descriptor() interprets it.
struct CaseDecl {
  std::string name;                             // NOLINT(readability-identifier-naming)
  CaseShape shape{CaseShape::kUnit};            // NOLINT(readability-identifier-naming)
  std::optional<nlohmann::json> uuid_type_attr;  // NOLINT(readability-identifier-naming)
  std::string pointer;                          // location of the case
};

// CategoryDecl is one entry of "declarations".
// kind is taken verbatim; only "enum" can be derived.
struct CategoryDecl {
  std::string name;             // NOLINT(readability-identifier-naming)
  std::string kind;             // NOLINT(readability-identifier-naming)
  std::vector<CaseDecl> cases;  // declaration order == discriminant order
  std::string pointer;          // location of the declaration
};

// Manifest is the syntactic content of a category manifest:
//
// {
//   "namespace": "acme::ids",
//   "declarations": [
//     { "name": "UserType", "kind": "enum",
//       "cases": [ "Retail",
//                  { "name": "Business" },
//                  { "name": "Organization",
//                    "attributes": { "uuid_type": { "prefix": "org" } } } ] }
//   ]
// }
//
// A case may be written as a bare string (unit case) or as an object.
struct Manifest {
  std::string name_space;                     // may be empty (global namespace)
  std::vector<CategoryDecl> declarations;     // NOLINT(readability-identifier-naming)
};

using ManifestResult = core::Result<Manifest, Diagnostics>;

// parse_manifest reads the structure of an already-parsed JSON document.
// Returns every structural problem found (wrong member types, missing names, ...).
[[nodiscard]] ManifestResult parse_manifest(const nlohmann::json& document);

// parse_manifest_text parses JSON text first; a JSON syntax error is reported
// as a single diagnostic carrying the JSON parser's message verbatim.
[[nodiscard]] ManifestResult parse_manifest_text(std::string_view text);

}  // namespace smartuuid::codegen
