#pragma once

#include "smartuuid/codegen/diagnostic.h"
#include "smartuuid/core/result.h"

#include <string>
#include <string_view>

namespace smartuuid::codegen {

struct GeneratedHeader {
  std::string text;      // NOLINT(readability-identifier-naming)
  Diagnostics warnings;  // NOLINT(readability-identifier-naming)
};

// generate_header runs the whole pipeline on manifest text:
// parse JSON -> read manifest -> derive descriptors -> emit header.
// source_name only labels the banner of the emitted header.
[[nodiscard]] core::Result<GeneratedHeader, Diagnostics> generate_header(
    std::string_view manifest_text, std::string_view source_name);

}  // namespace smartuuid::codegen
