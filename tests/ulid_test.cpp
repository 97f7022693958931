#include <canvas-merge/ulid.hpp>

#include <gtest/gtest.h>

#include <set>
#include <string>

using namespace canvas_merge;

TEST(Ulid, generated_ids_are_valid) {
    for (int i = 0; i < 100; ++i) {
        auto id = generate_ulid();
        EXPECT_EQ(id.size(), ulid_length);
        EXPECT_TRUE(is_valid_ulid(id)) << id;
    }
}

TEST(Ulid, generated_ids_are_unique) {
    auto ids = std::set<std::string>{};
    for (int i = 0; i < 1000; ++i) ids.insert(generate_ulid());
    EXPECT_EQ(ids.size(), 1000u);
}

TEST(Ulid, timestamp_prefix_sorts_by_time) {
    auto earlier = generate_ulid(1'700'000'000'000);
    auto later = generate_ulid(1'700'000'000'001);
    EXPECT_LT(earlier.substr(0, 10), later.substr(0, 10));
    EXPECT_LT(earlier, later);
}

TEST(Ulid, zero_timestamp_encodes_as_zeros) {
    auto id = generate_ulid(0);
    EXPECT_EQ(id.substr(0, 10), "0000000000");
}

TEST(Ulid, rejects_wrong_length) {
    EXPECT_FALSE(is_valid_ulid(""));
    EXPECT_FALSE(is_valid_ulid("01J000000000000000000000"));
    EXPECT_FALSE(is_valid_ulid("01J00000000000000000000000X"));
}

TEST(Ulid, rejects_excluded_and_lowercase_characters) {
    EXPECT_TRUE(is_valid_ulid("01J00000000000000000000000"));
    EXPECT_FALSE(is_valid_ulid("01J0000000000000000000000I"));
    EXPECT_FALSE(is_valid_ulid("01J0000000000000000000000L"));
    EXPECT_FALSE(is_valid_ulid("01J0000000000000000000000O"));
    EXPECT_FALSE(is_valid_ulid("01J0000000000000000000000U"));
    EXPECT_FALSE(is_valid_ulid("01j00000000000000000000000"));
}
