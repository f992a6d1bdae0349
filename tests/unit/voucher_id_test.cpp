// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "util/common/random_source.hpp"
#include "voucher/voucher_id.hpp"

#include <gtest/gtest.h>

TEST(voucher_id_test, parse_and_format) {
    auto id = evoucher::parse_voucher_id("550E8400-E29B-41D4-A716-446655440000");
    ASSERT_TRUE(id.has_value());
    ASSERT_EQ(evoucher::format_voucher_id(id.value()),
              "550e8400-e29b-41d4-a716-446655440000");
}

TEST(voucher_id_test, rejects_malformed) {
    for(const auto* str : {"",
                           "550e8400e29b41d4a716446655440000",
                           "550e8400-e29b-41d4-a716-44665544000",
                           "550e8400-e29b-41d4-a716-4466554400000",
                           "550e8400-e29b-41d4a-716-446655440000",
                           "550e8400-e29b-41d4-a716-44665544000g",
                           "not-a-uuid"}) {
        EXPECT_FALSE(evoucher::parse_voucher_id(str).has_value()) << str;
    }
}

TEST(voucher_id_test, generated_ids_are_version_4) {
    auto rng = evoucher::random_source();
    auto a = evoucher::generate_voucher_id(rng);
    auto b = evoucher::generate_voucher_id(rng);
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    ASSERT_NE(a.value(), b.value());

    auto text = evoucher::format_voucher_id(a.value());
    ASSERT_EQ(text[14], '4');
    ASSERT_NE(std::string("89ab").find(text[19]), std::string::npos);
    ASSERT_EQ(evoucher::parse_voucher_id(text), a);
}

TEST(voucher_id_test, generation_fails_without_entropy) {
    auto rng = evoucher::random_source("/nonexistent/entropy");
    ASSERT_FALSE(rng.good());
    ASSERT_FALSE(evoucher::generate_voucher_id(rng).has_value());
}
