#include "smartuuid/codegen/descriptor_builder.h"

#include "smartuuid/category/category_traits.h"
#include "smartuuid/category/prefix_policy.h"
#include "smartuuid/category/snake_case.h"

#include <algorithm>
#include <array>
#include <map>
#include <optional>
#include <set>

namespace smartuuid::codegen {

namespace {

constexpr std::string_view kEnumKind = "enum";
constexpr std::string_view kPrefixKey = "prefix";

using PrefixResult = core::Result<std::optional<std::string>, Diagnostic>;

// C++20 keywords, alternative tokens and TM TS reserved words.
constexpr std::array<std::string_view, 97> kCppKeywords = {
    "alignas",      "alignof",     "and",          "and_eq",       "asm",
    "auto",         "bitand",      "bitor",        "bool",         "break",
    "case",         "catch",       "char",         "char16_t",     "char32_t",
    "char8_t",      "class",       "co_await",     "co_return",    "co_yield",
    "compl",        "concept",     "const",        "const_cast",   "consteval",
    "constexpr",    "constinit",   "continue",     "decltype",     "default",
    "delete",       "do",          "double",       "dynamic_cast", "else",
    "enum",         "explicit",    "export",       "extern",       "false",
    "float",        "for",         "friend",       "goto",         "if",
    "inline",       "int",         "long",         "mutable",      "namespace",
    "new",          "noexcept",    "not",          "not_eq",       "nullptr",
    "operator",     "or",          "or_eq",        "private",      "protected",
    "public",       "register",    "reinterpret_cast", "requires", "return",
    "short",        "signed",      "sizeof",       "static",       "static_assert",
    "static_cast",  "struct",      "switch",       "template",     "this",
    "thread_local", "throw",       "true",         "try",          "typedef",
    "typeid",       "typename",    "union",        "unsigned",     "using",
    "virtual",      "void",        "volatile",     "wchar_t",      "while",
    "xor",          "xor_eq",      "atomic_cancel", "atomic_commit", "atomic_noexcept",
    "reflexpr",     "synchronized",
};

bool is_cpp_keyword(const std::string_view name) {
  return std::find(kCppKeywords.begin(), kCppKeywords.end(), name) != kCppKeywords.end();
}

// Reserved for the implementation: "__" anywhere, or '_' followed by an uppercase letter.
bool is_reserved_identifier(const std::string_view name) {
  if (name.find("__") != std::string_view::npos) {
    return true;
  }
  return name.size() > 1 && name[0] == '_' && name[1] >= 'A' && name[1] <= 'Z';
}

// Interpret #[uuid_type(...)] of one case. ok(nullopt) means "no override".
PrefixResult read_prefix_attribute(const CaseDecl& decl) {
  if (!decl.uuid_type_attr.has_value()) {
    return PrefixResult::ok(std::nullopt);
  }

  const std::string attr_pointer =
      pointer_append(pointer_append(decl.pointer, "attributes"), "uuid_type");
  const nlohmann::json& attr = decl.uuid_type_attr.value();
  if (!attr.is_object()) {
    return PrefixResult::err(make_error(attr_pointer, "uuid_type attribute must be an object"));
  }

  std::optional<std::string> prefix;
  for (const auto& item : attr.items()) {
    const std::string& key = item.key();
    const nlohmann::json& value = item.value();
    const std::string key_pointer = pointer_append(attr_pointer, key);
    if (key != kPrefixKey) {
      return PrefixResult::err(make_error(
          key_pointer, "unknown uuid_type attribute `" + key + "`. Expected `prefix = \"...\"`"));
    }
    if (!value.is_string()) {
      return PrefixResult::err(make_error(key_pointer, "uuid_type prefix must be a string"));
    }
    prefix = value.get<std::string>();
    if (!category::is_valid_prefix(prefix.value())) {
      return PrefixResult::err(make_error(key_pointer, "prefix `" + prefix.value() +
                                                           "` must be non-empty and contain no "
                                                           "whitespace or '-'"));
    }
  }
  return PrefixResult::ok(prefix);
}

std::string qualify(const std::string_view name_space, const std::string_view name) {
  if (name_space.empty()) {
    return std::string{name};
  }
  return std::string{name_space} + "::" + std::string{name};
}

}  // namespace

bool is_identifier(const std::string_view name) {
  if (name.empty()) {
    return false;
  }
  const auto is_alpha = [](const char ch) {
    return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || ch == '_';
  };
  if (!is_alpha(name.front())) {
    return false;
  }
  for (const char ch : name) {
    if (!is_alpha(ch) && !(ch >= '0' && ch <= '9')) {
      return false;
    }
  }
  return !is_cpp_keyword(name) && !is_reserved_identifier(name);
}

bool is_namespace_path(const std::string_view path) {
  if (path.empty()) {
    return true;
  }
  std::size_t start = 0;
  while (true) {
    const auto sep = path.find("::", start);
    const auto part = path.substr(start, sep == std::string_view::npos ? path.npos : sep - start);
    if (!is_identifier(part)) {
      return false;
    }
    if (sep == std::string_view::npos) {
      return true;
    }
    start = sep + 2;
  }
}

core::Result<CategoryDescriptor, Diagnostic> build_descriptor(const CategoryDecl& decl,
                                                              const std::string_view name_space) {
  using R = core::Result<CategoryDescriptor, Diagnostic>;

  if (decl.kind != kEnumKind) {
    return R::err(make_error(decl.pointer, "UuidType can only be derived for enumerations"));
  }
  if (!is_identifier(decl.name)) {
    return R::err(make_error(pointer_append(decl.pointer, "name"),
                             "name `" + decl.name + "` is not a valid identifier"));
  }

  for (const auto& c : decl.cases) {
    if (c.shape != CaseShape::kUnit) {
      return R::err(make_error(c.pointer,
                               "UuidType can only be derived for enumerations with unit cases "
                               "(only unit cases are permitted)"));
    }
  }

  const std::string cases_pointer = pointer_append(decl.pointer, "cases");
  if (decl.cases.empty()) {
    return R::err(make_error(cases_pointer,
                             "UuidType cannot be derived for empty enumerations "
                             "(at least one category required)"));
  }
  if (decl.cases.size() > kMaxCategories) {
    return R::err(make_error(
        cases_pointer, "UuidType can only be derived for enumerations with at most 256 cases"));
  }

  CategoryDescriptor descriptor;
  descriptor.name = decl.name;
  descriptor.type_name = qualify(name_space, decl.name);
  descriptor.cases.reserve(decl.cases.size());

  std::set<std::string> seen_names;
  for (std::size_t i = 0; i < decl.cases.size(); ++i) {
    const CaseDecl& c = decl.cases[i];
    if (!is_identifier(c.name)) {
      return R::err(make_error(c.pointer, "name `" + c.name + "` is not a valid identifier"));
    }
    if (!seen_names.insert(c.name).second) {
      return R::err(make_error(c.pointer, "duplicate case `" + c.name + "`"));
    }

    const auto prefix = read_prefix_attribute(c);
    if (!prefix.has_value()) {
      return R::err(prefix.error());
    }

    ResolvedCase resolved;
    resolved.name = c.name;
    resolved.discriminant = static_cast<std::uint8_t>(i);
    resolved.custom_prefix = prefix.value().has_value();
    resolved.prefix = resolved.custom_prefix ? prefix.value().value()
                                             : category::to_snake_case(c.name);
    resolved.pointer = c.pointer;
    descriptor.cases.push_back(std::move(resolved));
  }

  return R::ok(std::move(descriptor));
}

Diagnostics find_prefix_collisions(const CategoryDescriptor& descriptor) {
  Diagnostics warnings;
  std::map<std::string, const ResolvedCase*> first_by_prefix;
  for (const auto& c : descriptor.cases) {
    const auto [it, inserted] = first_by_prefix.emplace(c.prefix, &c);
    if (!inserted) {
      warnings.push_back(make_warning(c.pointer, "prefix `" + c.prefix + "` of case `" + c.name +
                                                     "` is also used by case `" +
                                                     it->second->name + "`"));
    }
  }
  return warnings;
}

core::Result<DescriptorSet, Diagnostics> build_descriptors(const Manifest& manifest) {
  using R = core::Result<DescriptorSet, Diagnostics>;

  Diagnostics errors;
  DescriptorSet set;
  set.name_space = manifest.name_space;

  if (!is_namespace_path(manifest.name_space)) {
    errors.push_back(make_error("/namespace", "namespace `" + manifest.name_space +
                                                  "` is not a valid C++ namespace"));
    return R::err(std::move(errors));
  }

  std::set<std::string> seen_declarations;
  for (const auto& decl : manifest.declarations) {
    if (!seen_declarations.insert(decl.name).second) {
      errors.push_back(make_error(pointer_append(decl.pointer, "name"),
                                  "duplicate declaration `" + decl.name + "`"));
      continue;
    }

    auto descriptor = build_descriptor(decl, manifest.name_space);
    if (!descriptor.has_value()) {
      errors.push_back(descriptor.error());
      continue;
    }

    auto collisions = find_prefix_collisions(descriptor.value());
    set.warnings.insert(set.warnings.end(), collisions.begin(), collisions.end());
    set.descriptors.push_back(descriptor.value());
  }

  if (!errors.empty()) {
    return R::err(std::move(errors));
  }
  return R::ok(std::move(set));
}

}  // namespace smartuuid::codegen
