#include <gtest/gtest.h>
#include <warden/schema/administrator_standing.hpp>
#include <warden/schema/entity_kind.hpp>
#include <warden/schema/error_code.hpp>
#include <warden/schema/status_category.hpp>
#include <warden/schema/status_type.hpp>

using namespace warden::schema;

TEST(status_type, names_match_the_persisted_strings) {
  EXPECT_EQ(to_string(status_type_t::pending), "pending");
  EXPECT_EQ(to_string(status_type_t::accepted), "accepted");
  EXPECT_EQ(to_string(status_type_t::rejected), "rejected");
  EXPECT_EQ(to_string(status_type_t::suspended_temporarily),
            "suspended temporarily");
  EXPECT_EQ(to_string(status_type_t::suspended_indefinitely),
            "suspended indefinitely");
}

TEST(status_type, parses_every_name_and_rejects_unknown) {
  for (const auto& [name, value] : kStatusTypeMappings) {
    auto parsed = try_from_string<status_type_t>(name);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, value);
  }
  EXPECT_FALSE(try_from_string<status_type_t>("suspended").has_value());
  EXPECT_FALSE(try_from_string<status_type_t>("Accepted").has_value());
}

TEST(status_type, reason_is_required_for_negative_states) {
  EXPECT_FALSE(requires_reason(status_type_t::pending));
  EXPECT_FALSE(requires_reason(status_type_t::accepted));
  EXPECT_TRUE(requires_reason(status_type_t::rejected));
  EXPECT_TRUE(requires_reason(status_type_t::suspended_temporarily));
  EXPECT_TRUE(requires_reason(status_type_t::suspended_indefinitely));
}

TEST(status_type, both_suspensions_share_one_category) {
  EXPECT_EQ(category_for(status_type_t::pending), status_category_t::pending);
  EXPECT_EQ(category_for(status_type_t::accepted), status_category_t::accepted);
  EXPECT_EQ(category_for(status_type_t::rejected), status_category_t::rejected);
  EXPECT_EQ(category_for(status_type_t::suspended_temporarily),
            status_category_t::suspended);
  EXPECT_EQ(category_for(status_type_t::suspended_indefinitely),
            status_category_t::suspended);
}

TEST(status_type, entity_kinds_and_error_codes_have_names) {
  EXPECT_EQ(to_string(entity_kind_t::users), "users");
  EXPECT_EQ(to_string(entity_kind_t::organizations), "organizations");
  EXPECT_EQ(try_from_string<entity_kind_t>("organizations"),
            entity_kind_t::organizations);
  EXPECT_EQ(to_string(error_code_t::stale_reference), "stale_reference");
  EXPECT_EQ(to_string(administrator_standing_t::removed), "removed");
  EXPECT_EQ(join_names(kStatusCategoryMappings),
            "pending|accepted|rejected|suspended");
}
