#include "smartuuid/codegen/descriptor_builder.h"
#include "smartuuid/codegen/manifest.h"

#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>

#include <string>

using namespace smartuuid::codegen;
using json = nlohmann::json;

namespace {

CategoryDecl declaration_from(const char* text) {
  const auto manifest = parse_manifest_text(text);
  REQUIRE(manifest.has_value());
  REQUIRE(manifest.value().declarations.size() == 1);
  return manifest.value().declarations[0];
}

CategoryDecl enum_with_cases(const std::size_t count) {
  CategoryDecl decl;
  decl.name = "Big";
  decl.kind = "enum";
  decl.pointer = "/declarations/0";
  for (std::size_t i = 0; i < count; ++i) {
    CaseDecl c;
    c.name = "C" + std::to_string(i);
    c.pointer = pointer_append("/declarations/0/cases", i);
    decl.cases.push_back(c);
  }
  return decl;
}

}  // namespace

TEST_CASE("build_descriptor: discriminants and prefixes", "[codegen][descriptor]") {
  const auto decl = declaration_from(R"({ "declarations": [
    { "name": "UserType", "kind": "enum",
      "cases": [ "Retail", "Business",
                 { "name": "Organization",
                   "attributes": { "uuid_type": { "prefix": "org" } } } ] } ] })");

  const auto result = build_descriptor(decl, "acme::ids");
  REQUIRE(result.has_value());
  const CategoryDescriptor& d = result.value();
  CHECK(d.name == "UserType");
  CHECK(d.type_name == "acme::ids::UserType");
  REQUIRE(d.cases.size() == 3);

  CHECK(d.cases[0].discriminant == 0);
  CHECK(d.cases[0].prefix == "retail");
  CHECK_FALSE(d.cases[0].custom_prefix);
  CHECK(d.cases[1].discriminant == 1);
  CHECK(d.cases[1].prefix == "business");
  CHECK(d.cases[2].discriminant == 2);
  CHECK(d.cases[2].prefix == "org");
  CHECK(d.cases[2].custom_prefix);
}

TEST_CASE("build_descriptor: global namespace keeps the bare name", "[codegen][descriptor]") {
  const auto decl = declaration_from(
      R"({ "declarations": [ { "name": "Kind", "kind": "enum", "cases": ["A"] } ] })");
  const auto result = build_descriptor(decl, "");
  REQUIRE(result.has_value());
  CHECK(result.value().type_name == "Kind");
}

TEST_CASE("build_descriptor: rejected declarations", "[codegen][descriptor]") {
  SECTION("not an enumeration") {
    const auto decl = declaration_from(
        R"({ "declarations": [ { "name": "S", "kind": "struct", "fields": {} } ] })");
    const auto r = build_descriptor(decl, "");
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error() ==
          make_error("/declarations/0", "UuidType can only be derived for enumerations"));
  }

  SECTION("empty enumeration") {
    const auto decl = declaration_from(
        R"({ "declarations": [ { "name": "E", "kind": "enum", "cases": [] } ] })");
    const auto r = build_descriptor(decl, "");
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error() == make_error("/declarations/0/cases",
                                  "UuidType cannot be derived for empty enumerations "
                                  "(at least one category required)"));
  }

  SECTION("tuple case") {
    const auto decl = declaration_from(R"({ "declarations": [
      { "name": "E", "kind": "enum", "cases": [ "A", { "name": "B", "fields": ["u32"] } ] } ] })");
    const auto r = build_descriptor(decl, "");
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error() == make_error("/declarations/0/cases/1",
                                  "UuidType can only be derived for enumerations with unit "
                                  "cases (only unit cases are permitted)"));
  }

  SECTION("record case") {
    const auto decl = declaration_from(R"({ "declarations": [
      { "name": "E", "kind": "enum", "cases": [ { "name": "R", "fields": { "id": "u32" } } ] } ] })");
    const auto r = build_descriptor(decl, "");
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error().pointer == "/declarations/0/cases/0");
    CHECK(r.error().message.starts_with(
        "UuidType can only be derived for enumerations with unit cases"));
  }

  SECTION("more than 256 cases") {
    const auto r = build_descriptor(enum_with_cases(257), "");
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error() ==
          make_error("/declarations/0/cases",
                     "UuidType can only be derived for enumerations with at most 256 cases"));
  }

  SECTION("invalid declaration name") {
    const auto decl = declaration_from(
        R"({ "declarations": [ { "name": "User Type", "kind": "enum", "cases": ["A"] } ] })");
    const auto r = build_descriptor(decl, "");
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error() ==
          make_error("/declarations/0/name", "name `User Type` is not a valid identifier"));
  }

  SECTION("invalid case name") {
    const auto decl = declaration_from(
        R"({ "declarations": [ { "name": "E", "kind": "enum", "cases": ["A", "9Lives"] } ] })");
    const auto r = build_descriptor(decl, "");
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error() ==
          make_error("/declarations/0/cases/1", "name `9Lives` is not a valid identifier"));
  }

  SECTION("C++ keyword as case name") {
    const auto decl = declaration_from(R"({ "declarations": [
      { "name": "Kind", "kind": "enum", "cases": ["Retail", "default", "kCount"] } ] })");
    const auto r = build_descriptor(decl, "p");
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error() ==
          make_error("/declarations/0/cases/1", "name `default` is not a valid identifier"));
  }

  SECTION("reserved case name") {
    const auto decl = declaration_from(
        R"({ "declarations": [ { "name": "Kind", "kind": "enum", "cases": ["_Hidden"] } ] })");
    const auto r = build_descriptor(decl, "p");
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error() ==
          make_error("/declarations/0/cases/0", "name `_Hidden` is not a valid identifier"));
  }

  SECTION("C++ keyword as declaration name") {
    const auto decl = declaration_from(
        R"({ "declarations": [ { "name": "class", "kind": "enum", "cases": ["A"] } ] })");
    const auto r = build_descriptor(decl, "");
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error() ==
          make_error("/declarations/0/name", "name `class` is not a valid identifier"));
  }

  SECTION("duplicate case") {
    const auto decl = declaration_from(
        R"({ "declarations": [ { "name": "E", "kind": "enum", "cases": ["A", "B", "A"] } ] })");
    const auto r = build_descriptor(decl, "");
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error() == make_error("/declarations/0/cases/2", "duplicate case `A`"));
  }
}

TEST_CASE("build_descriptor: 256 cases use every byte", "[codegen][descriptor]") {
  const auto r = build_descriptor(enum_with_cases(256), "big");
  REQUIRE(r.has_value());
  REQUIRE(r.value().cases.size() == 256);
  CHECK(r.value().cases.front().discriminant == 0);
  CHECK(r.value().cases.back().discriminant == 255);
  CHECK(r.value().cases.back().prefix == "c255");
}

TEST_CASE("build_descriptor: uuid_type attribute", "[codegen][descriptor]") {
  SECTION("unknown key") {
    const auto decl = declaration_from(R"({ "declarations": [
      { "name": "E", "kind": "enum",
        "cases": [ { "name": "A", "attributes": { "uuid_type": { "prfx": "a" } } } ] } ] })");
    const auto r = build_descriptor(decl, "");
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error() == make_error("/declarations/0/cases/0/attributes/uuid_type/prfx",
                                  "unknown uuid_type attribute `prfx`. Expected `prefix = "
                                  "\"...\"`"));
  }

  SECTION("not an object") {
    const auto decl = declaration_from(R"({ "declarations": [
      { "name": "E", "kind": "enum",
        "cases": [ { "name": "A", "attributes": { "uuid_type": "a" } } ] } ] })");
    const auto r = build_descriptor(decl, "");
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error() == make_error("/declarations/0/cases/0/attributes/uuid_type",
                                  "uuid_type attribute must be an object"));
  }

  SECTION("prefix is not a string") {
    const auto decl = declaration_from(R"({ "declarations": [
      { "name": "E", "kind": "enum",
        "cases": [ { "name": "A", "attributes": { "uuid_type": { "prefix": 1 } } } ] } ] })");
    const auto r = build_descriptor(decl, "");
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error() == make_error("/declarations/0/cases/0/attributes/uuid_type/prefix",
                                  "uuid_type prefix must be a string"));
  }

  SECTION("prefix with a hyphen") {
    const auto decl = declaration_from(R"({ "declarations": [
      { "name": "E", "kind": "enum",
        "cases": [ { "name": "A", "attributes": { "uuid_type": { "prefix": "a-b" } } } ] } ] })");
    const auto r = build_descriptor(decl, "");
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error().message ==
          "prefix `a-b` must be non-empty and contain no whitespace or '-'");
  }

  SECTION("empty prefix") {
    const auto decl = declaration_from(R"({ "declarations": [
      { "name": "E", "kind": "enum",
        "cases": [ { "name": "A", "attributes": { "uuid_type": { "prefix": "" } } } ] } ] })");
    const auto r = build_descriptor(decl, "");
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error().pointer == "/declarations/0/cases/0/attributes/uuid_type/prefix");
  }

  SECTION("empty attribute object keeps the derived prefix") {
    const auto decl = declaration_from(R"({ "declarations": [
      { "name": "E", "kind": "enum",
        "cases": [ { "name": "PurchaseOrder", "attributes": { "uuid_type": {} } } ] } ] })");
    const auto r = build_descriptor(decl, "");
    REQUIRE(r.has_value());
    CHECK(r.value().cases[0].prefix == "purchase_order");
    CHECK_FALSE(r.value().cases[0].custom_prefix);
  }
}

TEST_CASE("find_prefix_collisions warns about shared prefixes", "[codegen][descriptor]") {
  const auto decl = declaration_from(R"({ "declarations": [
    { "name": "E", "kind": "enum",
      "cases": [ "Retail", { "name": "Shop", "attributes": { "uuid_type": { "prefix": "retail" } } },
                 "Other" ] } ] })");
  const auto r = build_descriptor(decl, "");
  REQUIRE(r.has_value());

  const auto warnings = find_prefix_collisions(r.value());
  REQUIRE(warnings.size() == 1);
  CHECK(warnings[0] == make_warning("/declarations/0/cases/1",
                                    "prefix `retail` of case `Shop` is also used by case `Retail`"));
}

TEST_CASE("build_descriptors: whole manifest", "[codegen][descriptor]") {
  SECTION("collects one error per failing declaration") {
    const auto manifest = parse_manifest_text(R"({ "declarations": [
      { "name": "Good", "kind": "enum", "cases": ["A"] },
      { "name": "S", "kind": "struct" },
      { "name": "Empty", "kind": "enum", "cases": [] } ] })");
    REQUIRE(manifest.has_value());
    const auto r = build_descriptors(manifest.value());
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.error().size() == 2);
    CHECK(r.error()[0].pointer == "/declarations/1");
    CHECK(r.error()[1].pointer == "/declarations/2/cases");
  }

  SECTION("duplicate declaration names") {
    const auto manifest = parse_manifest_text(R"({ "declarations": [
      { "name": "E", "kind": "enum", "cases": ["A"] },
      { "name": "E", "kind": "enum", "cases": ["B"] } ] })");
    REQUIRE(manifest.has_value());
    const auto r = build_descriptors(manifest.value());
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error() ==
          Diagnostics{make_error("/declarations/1/name", "duplicate declaration `E`")});
  }

  SECTION("invalid namespace") {
    const auto manifest = parse_manifest_text(
        R"({ "namespace": "acme..ids", "declarations": [] })");
    REQUIRE(manifest.has_value());
    const auto r = build_descriptors(manifest.value());
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error() == Diagnostics{make_error(
                           "/namespace", "namespace `acme..ids` is not a valid C++ namespace")});
  }

  SECTION("warnings travel with the result") {
    const auto manifest = parse_manifest_text(R"({ "namespace": "a::b", "declarations": [
      { "name": "E", "kind": "enum",
        "cases": [ "Alpha", { "name": "Beta", "attributes": { "uuid_type": { "prefix": "alpha" } } } ] },
      { "name": "F", "kind": "enum", "cases": ["Gamma"] } ] })");
    REQUIRE(manifest.has_value());
    const auto r = build_descriptors(manifest.value());
    REQUIRE(r.has_value());
    CHECK(r.value().name_space == "a::b");
    CHECK(r.value().descriptors.size() == 2);
    REQUIRE(r.value().warnings.size() == 1);
    CHECK(r.value().warnings[0].severity == Severity::kWarning);
  }
}

TEST_CASE("Identifier and namespace checks", "[codegen][descriptor]") {
  CHECK(is_identifier("UserType"));
  CHECK(is_identifier("_private"));
  CHECK(is_identifier("V099"));
  CHECK_FALSE(is_identifier(""));
  CHECK_FALSE(is_identifier("9Lives"));
  CHECK_FALSE(is_identifier("has-hyphen"));
  CHECK_FALSE(is_identifier("default"));
  CHECK_FALSE(is_identifier("class"));
  CHECK_FALSE(is_identifier("new"));
  CHECK_FALSE(is_identifier("_Foo"));
  CHECK_FALSE(is_identifier("a__b"));
  CHECK(is_identifier("kCount"));
  CHECK(is_identifier("Default"));

  CHECK(is_namespace_path(""));
  CHECK(is_namespace_path("acme"));
  CHECK(is_namespace_path("acme::ids"));
  CHECK_FALSE(is_namespace_path("::acme"));
  CHECK_FALSE(is_namespace_path("acme::"));
  CHECK_FALSE(is_namespace_path("acme..ids"));
  CHECK_FALSE(is_namespace_path("acme::namespace"));
}
