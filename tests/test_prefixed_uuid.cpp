#include "smartuuid/core/random_source.h"
#include "smartuuid/prefixed/prefixed_format.h"
#include "smartuuid/prefixed/prefixed_uuid.h"

#include <catch2/catch_test_macros.hpp>

#include "categories/custom_prefix.h"
#include "categories/user_type.h"
#include <algorithm>
#include <sstream>
#include <string>
#include <unordered_set>

using namespace smartuuid;
using fixtures::DocumentKind;
using fixtures::UserType;
using UserId = TypedUuid<UserType>;
using PrefixedUserId = PrefixedUuid<UserType>;

// ── split_prefixed / compose_prefixed ──────────────────────────────────────

TEST_CASE("split_prefixed splits at the last underscore", "[prefixed][format]") {
  const auto parts = split_prefixed("purchase_order_0311c5f2-1b2e-8c4d-9a0f-5d6e7f809a1b");
  REQUIRE(parts.has_value());
  CHECK(parts.value().prefix == "purchase_order");
  CHECK(parts.value().uuid_text == "0311c5f2-1b2e-8c4d-9a0f-5d6e7f809a1b");

  const auto empty_prefix = split_prefixed("_abc");
  REQUIRE(empty_prefix.has_value());
  CHECK(empty_prefix.value().prefix.empty());
  CHECK(empty_prefix.value().uuid_text == "abc");
}

TEST_CASE("split_prefixed without underscore is an invalid format", "[prefixed][format]") {
  const auto parts = split_prefixed("retail550e8400-e29b-41d4-a716-446655440000");
  REQUIRE_FALSE(parts.has_value());
  CHECK(parts.error().kind == TypedUuidErrorKind::kInvalidFormat);
  CHECK(parts.error().message() ==
        "invalid format: expected format 'prefix_uuid', no underscore found");
}

TEST_CASE("compose_prefixed joins prefix and UUID text", "[prefixed][format]") {
  const auto uuid = core::parse_uuid("00111111-1111-8111-9111-111111111111");
  REQUIRE(uuid.has_value());
  CHECK(compose_prefixed("org", uuid.value()) == "org_00111111-1111-8111-9111-111111111111");
}

// ── PrefixedUuid ───────────────────────────────────────────────────────────

TEST_CASE("PrefixedUuid text form is prefix, underscore, UUID", "[prefixed]") {
  const auto x = UserId::generate(UserType::Retail);
  const PrefixedUserId y = PrefixedUserId::from_typed(x);

  const std::string text = y.to_string();
  CHECK(text.starts_with("retail_"));
  CHECK(text.size() == 43);
  CHECK(text.substr(7) == x.to_string());

  const auto parsed = PrefixedUserId::parse(text);
  REQUIRE(parsed.has_value());
  CHECK(parsed.value().as_typed() == x);
  CHECK(parsed.value() == y);
}

TEST_CASE("PrefixedUuid round-trips for every category", "[prefixed]") {
  for (const auto t : {UserType::Retail, UserType::Business, UserType::Organization}) {
    const auto y = PrefixedUserId::generate(t);
    const auto parsed = PrefixedUserId::parse(y.to_string());
    REQUIRE(parsed.has_value());
    CHECK(parsed.value() == y);
    CHECK(parsed.value().category() == t);
  }
}

TEST_CASE("Deterministic prefixed rendering", "[prefixed]") {
  core::SequenceRandomSource random(0x11);
  const auto retail = PrefixedUserId::generate(UserType::Retail, random);
  CHECK(retail.to_string() == "retail_00111111-1111-8111-9111-111111111111");

  const auto org = PrefixedUserId::generate(UserType::Organization, random);
  CHECK(org.to_string() == "org_02121212-1212-8212-9212-121212121212");
  CHECK(org.prefix() == "org");

  std::ostringstream os;
  os << retail;
  CHECK(os.str() == "retail_00111111-1111-8111-9111-111111111111");
}

TEST_CASE("Wrong prefix is reported as unknown prefix", "[prefixed]") {
  const auto x = UserId::generate(UserType::Retail);
  const auto r = PrefixedUserId::parse("wrong_" + x.to_string());
  REQUIRE_FALSE(r.has_value());
  CHECK(r.error().kind == TypedUuidErrorKind::kUnknownPrefix);
  CHECK(r.error().prefix == "wrong");
  CHECK(r.error().message() == "unknown prefix 'wrong' for type fixtures::UserType");
}

TEST_CASE("Any prefix other than the category's is rejected", "[prefixed]") {
  const auto x = UserId::generate(UserType::Retail);
  for (const std::string p : {"business", "org", "Retail", "retai", "retail ", "", "re_tail"}) {
    const auto r = PrefixedUserId::parse(p + "_" + x.to_string());
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error().kind == TypedUuidErrorKind::kUnknownPrefix);
    CHECK(r.error().prefix == p);
  }
}

TEST_CASE("Missing underscore is an invalid format", "[prefixed]") {
  const auto r = PrefixedUserId::parse("retail550e8400-e29b-41d4-a716-446655440000");
  REQUIRE_FALSE(r.has_value());
  CHECK(r.error().kind == TypedUuidErrorKind::kInvalidFormat);
}

TEST_CASE("UUID part is validated before the prefix", "[prefixed]") {
  SECTION("malformed UUID text") {
    const auto r = PrefixedUserId::parse("retail_550e8400-e29b-41d4-a716");
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error().kind == TypedUuidErrorKind::kParseError);
  }

  SECTION("unmapped discriminant") {
    const auto r = PrefixedUserId::parse("wrong_ff111111-1111-8111-9111-111111111111");
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error().kind == TypedUuidErrorKind::kInvalidDiscriminant);
    CHECK(r.error().found == 255);
  }

  SECTION("prefix of another category in the same set") {
    const auto r = PrefixedUserId::parse("business_00111111-1111-8111-9111-111111111111");
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error().kind == TypedUuidErrorKind::kUnknownPrefix);
    CHECK(r.error().prefix == "business");
  }
}

TEST_CASE("Underscore inside a prefix survives the round trip", "[prefixed]") {
  const auto y = PrefixedUuid<DocumentKind>::generate(DocumentKind::PurchaseOrder);
  const std::string text = y.to_string();

  CHECK(text.starts_with("purchase_order_"));
  CHECK(std::count(text.begin(), text.end(), '_') == 2);
  CHECK(text.rfind('_') == std::string{"purchase_order"}.size());

  const auto parsed = PrefixedUuid<DocumentKind>::parse(text);
  REQUIRE(parsed.has_value());
  CHECK(parsed.value() == y);
  CHECK(parsed.value().category() == DocumentKind::PurchaseOrder);
}

TEST_CASE("Single-letter prefix", "[prefixed]") {
  const auto y = PrefixedUuid<DocumentKind>::generate(DocumentKind::Quote);
  CHECK(y.to_string().starts_with("q_03"));
  CHECK(y.to_string().size() == 38);
}

TEST_CASE("Conversions between typed and prefixed forms are total", "[prefixed]") {
  const auto x = UserId::generate(UserType::Business);
  const PrefixedUserId y = x;
  const UserId back = y;

  CHECK(back == x);
  CHECK(y.to_typed() == x);
  CHECK(y.as_uuid() == x.as_uuid());
  CHECK(std::hash<PrefixedUserId>{}(y) == std::hash<UserId>{}(x));

  std::unordered_set<PrefixedUserId> set;
  set.insert(y);
  set.insert(PrefixedUserId::from_typed(x));
  CHECK(set.size() == 1);
}
