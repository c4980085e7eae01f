#include "smartuuid/codegen/generator.h"

#include "smartuuid/codegen/descriptor_builder.h"
#include "smartuuid/codegen/header_emitter.h"
#include "smartuuid/codegen/manifest.h"

namespace smartuuid::codegen {

core::Result<GeneratedHeader, Diagnostics> generate_header(const std::string_view manifest_text,
                                                           const std::string_view source_name) {
  using R = core::Result<GeneratedHeader, Diagnostics>;

  const auto manifest = parse_manifest_text(manifest_text);
  if (!manifest.has_value()) {
    return R::err(manifest.error());
  }

  const auto descriptors = build_descriptors(manifest.value());
  if (!descriptors.has_value()) {
    return R::err(descriptors.error());
  }

  GeneratedHeader header;
  header.text = emit_header(descriptors.value(), source_name);
  header.warnings = descriptors.value().warnings;
  return R::ok(std::move(header));
}

}  // namespace smartuuid::codegen
