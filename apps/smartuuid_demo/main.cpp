#include "smartuuid/category/descriptor_check.h"
#include "smartuuid/core/random_source.h"
#include "smartuuid/core/version.h"
#include "smartuuid/prefixed/prefixed_uuid.h"
#include "smartuuid/prefixed/prefixed_uuid_json.h"
#include "smartuuid/typed/typed_uuid.h"
#include "smartuuid/typed/typed_uuid_json.h"

#include <nlohmann/json.hpp>

#include "categories/user_type.h"
#include "config.h"
#include "document_type.h"
#include <iostream>
#include <memory>
#include <string>

using namespace smartuuid;

namespace {

// Print one JSON line per generated identifier, for every category of T.
template <UuidCategory T>
void show_category_set(const std::string& title, core::IRandomSource& random, const int count) {
  std::cout << "-- " << title << " (" << category_traits<T>::kTypeName << ") --\n";
  for (std::size_t d = 0; d < category_traits<T>::kCount; ++d) {
    const auto category = category_traits<T>::from_discriminant(static_cast<std::uint8_t>(d));
    if (!category.has_value()) {
      continue;
    }
    for (int i = 0; i < count; ++i) {
      const auto typed = TypedUuid<T>::generate(category.value(), random);
      const PrefixedUuid<T> prefixed = typed;

      nlohmann::json line;
      line["discriminant"] = typed.discriminant();
      line["prefix"] = std::string{typed.prefix()};
      line["typed"] = typed;
      line["prefixed"] = prefixed;
      std::cout << line.dump() << "\n";
    }
  }
}

int run_parse(const std::string& text) {
  const auto parsed = PrefixedUuid<demo::UserType>::parse(text);
  if (!parsed.has_value()) {
    std::cerr << "error: " << parsed.error().message() << "\n";
    return 1;
  }

  const auto& id = parsed.value();
  nlohmann::json out;
  out["input"] = text;
  out["prefix"] = std::string{id.prefix()};
  out["discriminant"] = id.as_typed().discriminant();
  out["uuid"] = id.as_typed();
  out["version8"] = core::is_version8(id.as_uuid());
  std::cout << out.dump(2) << "\n";
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {  // NOLINT(bugprone-exception-escape)
  const auto options = demo::demo_options();
  const auto parsed = apps::parse_options(argc, argv, options);

  if (parsed.help_requested) {
    apps::print_usage(std::cout, "smartuuid_demo [--count N] [--parse TEXT] [--deterministic]",
                      options);
    return 0;
  }
  if (parsed.error_count > 0) {
    return 1;
  }

  const auto& config = parsed.config;
  const std::string config_error = demo::validate_demo_config(config);
  if (!config_error.empty()) {
    std::cerr << config_error << "\n";
    return 1;
  }

  if (config.parse_text.has_value()) {
    return run_parse(config.parse_text.value());
  }

  // Hand-written descriptors are not checked by the generator; certify before first use.
  const auto check = category::check_category_traits<demo::DocumentType>();
  if (!check.has_value()) {
    std::cerr << "error: " << check.error() << "\n";
    return 1;
  }

  std::cerr << "smartuuid demo v" << core::kBuildVersion << "\n";
  std::unique_ptr<core::SequenceRandomSource> sequence;
  if (config.deterministic) {
    std::cerr << "Random source: deterministic sequence (not unique across runs)\n";
    sequence = std::make_unique<core::SequenceRandomSource>();
  } else {
    std::cerr << "Random source: system entropy\n";
  }
  core::IRandomSource& random =
      sequence ? static_cast<core::IRandomSource&>(*sequence) : core::default_random_source();

  show_category_set<demo::UserType>("generated descriptor", random, config.count);
  show_category_set<demo::DocumentType>("hand-written descriptor", random, config.count);
  return 0;
}
