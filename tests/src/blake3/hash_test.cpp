#include <capvault/blake3/hash.hpp>
#include <gtest/gtest.h>

#include <string_view>

TEST(blake3_hash, empty_input_matches_reference_digest) {
  auto digest = capvault::blake3::hash(std::string_view{});
  EXPECT_EQ(capvault::schema::to_hex(
                capvault::schema::bytes_view_t{digest.data(), digest.size()}),
            "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262");
}

TEST(blake3_hash, incremental_updates_match_one_shot) {
  auto hasher = capvault::blake3::hasher{};
  hasher.update(std::string_view{"capvault-"});
  auto tail = capvault::schema::make_bytes(std::string_view{"state"});
  hasher.update(capvault::schema::make_bytes_view(tail));

  EXPECT_EQ(hasher.finalize(),
            capvault::blake3::hash(std::string_view{"capvault-state"}));
  EXPECT_NE(hasher.finalize(),
            capvault::blake3::hash(std::string_view{"capvault-State"}));
}
