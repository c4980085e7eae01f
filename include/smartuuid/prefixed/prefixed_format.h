#pragma once

#include "smartuuid/core/result.h"
#include "smartuuid/core/uuid128.h"
#include "smartuuid/typed/typed_uuid_error.h"

#include <string>
#include <string_view>

namespace smartuuid {

// Separator between the category prefix and the UUID text.
inline constexpr char kPrefixSeparator = '_';

// PrefixedParts holds views into the text passed to split_prefixed().
// The views are valid only as long as that text is.
struct PrefixedParts {
  std::string_view prefix;     // NOLINT(readability-identifier-naming)
  std::string_view uuid_text;  // NOLINT(readability-identifier-naming)
};

// split_prefixed splits "<prefix>_<uuid>" at the LAST underscore.
// Prefixes may contain underscores ("purchase_order"); hyphenated UUIDs never do,
// so the rightmost underscore is always the separator.
// Fails with kInvalidFormat when the text has no underscore.
[[nodiscard]] core::Result<PrefixedParts, TypedUuidError> split_prefixed(std::string_view text);

// compose_prefixed renders "<prefix>_<uuid-36>".
[[nodiscard]] std::string compose_prefixed(std::string_view prefix, const core::Uuid128& uuid);

}  // namespace smartuuid
