#include <gtest/gtest.h>
#include <warden/schema/encoding/scale/encoder.hpp>
#include <warden/testing/common.hpp>

#include <algorithm>

using warden::testing::make_hash;

namespace {

using encoder_t = warden::schema::encoding::encoder<
    warden::schema::encoding::scale_encoder_tag>;

warden::schema::status_record_t make_status_record() {
  auto record = warden::schema::status_record_t{};
  record.subject = make_hash(1);
  record.original_hash = make_hash(2);
  record.previous_hash = make_hash(3);
  record.depth = 4;
  record.author = make_hash(5);
  record.created_at = 1'700'000'000'000ULL;
  record.payload.status_type =
      warden::schema::status_type_t::suspended_temporarily;
  record.payload.reason = "spam";
  record.payload.suspended_until = 1'700'604'800'000ULL;
  record.signature.fill(0x5A);
  return record;
}

}  // namespace

TEST(schema_encoding_types, status_record_round_trips) {
  auto codec = encoder_t{};
  auto record = make_status_record();
  auto decoded = codec.decode<warden::schema::status_record_t>(
      warden::schema::make_bytes_view(codec.encode(record)));

  EXPECT_EQ(decoded.version, 1u);
  EXPECT_EQ(decoded.subject, record.subject);
  EXPECT_EQ(decoded.original_hash, record.original_hash);
  EXPECT_EQ(decoded.previous_hash, record.previous_hash);
  EXPECT_EQ(decoded.depth, record.depth);
  EXPECT_EQ(decoded.author, record.author);
  EXPECT_EQ(decoded.created_at, record.created_at);
  EXPECT_EQ(decoded.payload, record.payload);
  EXPECT_EQ(decoded.signature, record.signature);
}

TEST(schema_encoding_types, replica_round_trips_links_and_records) {
  auto codec = encoder_t{};
  auto replica = warden::schema::replica_t{};
  auto link = warden::schema::entity_link_t{};
  link.entity = warden::testing::make_organization(7);
  link.status_original_hash = make_hash(8);
  link.agent_keys = {make_hash(9), make_hash(10)};
  replica.entity_links.push_back(link);
  replica.status_records.push_back(make_status_record());
  auto admin = warden::schema::administrator_record_t{};
  admin.payload.entity = warden::testing::make_user(11);
  admin.payload.agent_keys = {make_hash(12)};
  admin.payload.standing = warden::schema::administrator_standing_t::removed;
  admin.payload.reason = "rotated";
  replica.administrator_records.push_back(admin);

  auto decoded = codec.try_decode<warden::schema::replica_t>(
      warden::schema::make_bytes_view(codec.encode(replica)));
  ASSERT_TRUE(decoded.has_value());
  ASSERT_EQ(decoded->entity_links.size(), 1u);
  EXPECT_EQ(decoded->entity_links[0].entity, link.entity);
  EXPECT_EQ(decoded->entity_links[0].agent_keys, link.agent_keys);
  ASSERT_EQ(decoded->status_records.size(), 1u);
  EXPECT_EQ(decoded->status_records[0].payload,
            replica.status_records[0].payload);
  ASSERT_EQ(decoded->administrator_records.size(), 1u);
  EXPECT_EQ(decoded->administrator_records[0].payload.standing,
            warden::schema::administrator_standing_t::removed);
  EXPECT_EQ(decoded->administrator_records[0].payload.entity, admin.payload.entity);
}

TEST(schema_encoding_types, encode_overload_appends_exact_payload_bytes) {
  auto codec = encoder_t{};
  auto record = make_status_record();
  auto encoded = codec.encode(record);

  auto out = warden::schema::bytes_t{0xDE, 0xAD, 0xBE, 0xEF};
  codec.encode(record, out);

  ASSERT_EQ(out.size(), (4u + encoded.size()));
  EXPECT_EQ(out[0], 0xDE);
  EXPECT_EQ(out[3], 0xEF);
  EXPECT_TRUE(std::equal(std::begin(encoded), std::end(encoded),
                         std::begin(out) + 4));
}

TEST(schema_encoding_types, try_decode_rejects_truncated_bytes) {
  auto codec = encoder_t{};
  auto encoded = codec.encode(make_status_record());
  ASSERT_GT(encoded.size(), 8u);
  encoded.resize(encoded.size() - 5);

  auto decoded = codec.try_decode<warden::schema::status_record_t>(
      warden::schema::make_bytes_view(encoded));
  EXPECT_FALSE(decoded.has_value());
}

TEST(schema_encoding_types, try_decode_rejects_unknown_enum_values) {
  auto codec = encoder_t{};
  auto status = warden::schema::status_t{};
  auto encoded = codec.encode(status);
  // version (2 bytes) then the status type byte.
  ASSERT_GT(encoded.size(), 2u);
  encoded[2] = 0x42;

  auto decoded = codec.try_decode<warden::schema::status_t>(
      warden::schema::make_bytes_view(encoded));
  EXPECT_FALSE(decoded.has_value());
}
