#include "smartuuid/prefixed/prefixed_format.h"

namespace smartuuid {

core::Result<PrefixedParts, TypedUuidError> split_prefixed(const std::string_view text) {
  using R = core::Result<PrefixedParts, TypedUuidError>;

  const auto pos = text.rfind(kPrefixSeparator);
  if (pos == std::string_view::npos) {
    return R::err(
        TypedUuidError::invalid_format("expected format 'prefix_uuid', no underscore found"));
  }
  return R::ok(PrefixedParts{text.substr(0, pos), text.substr(pos + 1)});
}

std::string compose_prefixed(const std::string_view prefix, const core::Uuid128& uuid) {
  std::string out;
  out.reserve(prefix.size() + 1 + core::kUuidTextLength);
  out.append(prefix);
  out.push_back(kPrefixSeparator);
  out.append(core::to_string(uuid));
  return out;
}

}  // namespace smartuuid
