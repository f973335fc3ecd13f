#include <gtest/gtest.h>
#include <clearhouse/crypto/digest.hpp>
#include <clearhouse/schema/batch_status.hpp>
#include <clearhouse/schema/ledger_event.hpp>
#include <clearhouse/schema/primitives.hpp>
#include <clearhouse/schema/settlement_window.hpp>
#include <clearhouse/schema/validation_error_code.hpp>

TEST(primitives, hex_round_trips_bytes) {
  auto payload = clearhouse::schema::bytes_t{0x00, 0x01, 0xAB, 0xFF};
  auto hex = clearhouse::schema::to_hex(payload);
  EXPECT_EQ(hex, "0001abff");
  auto decoded = clearhouse::schema::try_from_hex("0x" + hex);
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(*decoded, payload);
}

TEST(primitives, try_from_hex_rejects_invalid_input) {
  EXPECT_FALSE(clearhouse::schema::try_from_hex("abc").has_value());
  EXPECT_FALSE(clearhouse::schema::try_from_hex("zz").has_value());
}

TEST(primitives, cost_renders_with_fixed_digits) {
  auto cost = clearhouse::schema::cost_t{"4.25"};
  EXPECT_EQ(clearhouse::schema::to_string(cost, 2), "4.25");
  EXPECT_EQ(clearhouse::schema::to_string(cost), "4.250000");
}

TEST(primitives, settlement_window_parses_known_names_only) {
  EXPECT_EQ(clearhouse::schema::try_from_string<
                clearhouse::schema::settlement_window_t>("t1"),
            clearhouse::schema::settlement_window_t::t1);
  EXPECT_FALSE(clearhouse::schema::try_from_string<
                   clearhouse::schema::settlement_window_t>("T1")
                   .has_value());
  EXPECT_EQ(
      clearhouse::schema::to_string(clearhouse::schema::settlement_window_t::rtgs),
      "rtgs");
}

TEST(primitives, enum_names_match_wire_names) {
  EXPECT_EQ(clearhouse::schema::to_string(
                clearhouse::schema::batch_status_t::infeasible),
            "INFEASIBLE");
  EXPECT_EQ(clearhouse::schema::to_string(
                clearhouse::schema::ledger_event_type_t::batch_netted),
            "BATCH_NETTED");
  EXPECT_EQ(clearhouse::schema::to_string(
                clearhouse::schema::validation_error_code::queue_full),
            "queue_full");
  EXPECT_TRUE(clearhouse::schema::is_retryable(
      clearhouse::schema::validation_error_code::queue_full));
  EXPECT_FALSE(clearhouse::schema::is_retryable(
      clearhouse::schema::validation_error_code::invalid_amount));
}

TEST(primitives, sha256_matches_known_digest) {
  auto digest = clearhouse::crypto::sha256(std::string_view{"abc"});
  EXPECT_EQ(clearhouse::schema::to_hex(digest),
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(primitives, sha256_parts_is_boundary_sensitive) {
  auto left = clearhouse::crypto::sha256_parts({"ab", "c"});
  auto right = clearhouse::crypto::sha256_parts({"a", "bc"});
  EXPECT_NE(left, right);
  EXPECT_EQ(left, clearhouse::crypto::sha256_parts({"ab", "c"}));
}

TEST(primitives, sha256_parts_prefixes_little_endian_lengths) {
  auto framed = clearhouse::schema::bytes_t{0x03, 0x00, 0x00, 0x00, 0x00,
                                            0x00, 0x00, 0x00, 'a',  'b',
                                            'c',  0x00, 0x00, 0x00, 0x00,
                                            0x00, 0x00, 0x00, 0x00};
  EXPECT_EQ(clearhouse::crypto::sha256_parts({"abc", ""}),
            clearhouse::crypto::sha256(clearhouse::schema::bytes_view_t{
                framed.data(), framed.size()}));
}

TEST(primitives, fingerprint_is_stable_hex) {
  auto first = clearhouse::crypto::fingerprint("key-1");
  EXPECT_TRUE(first.starts_with("dedup:"));
  EXPECT_EQ(first.size(), 70u);
  EXPECT_EQ(first, clearhouse::crypto::fingerprint("key-1"));
  EXPECT_NE(first, clearhouse::crypto::fingerprint("key-2"));
}
