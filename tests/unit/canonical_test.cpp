// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "../util.hpp"
#include "voucher/canonical.hpp"

#include <gtest/gtest.h>

TEST(canonical_test, known_encoding) {
    auto secret
        = evoucher::test::make_secret(evoucher::test::sample_terms());
    auto enc = evoucher::canonical_encode(secret);
    ASSERT_EQ(enc.to_hex(),
              "aa"
              "646d656d6f"
              "f6"
              "64756e6974"
              "63736174"
              "686973737565724964"
              "6a6d65726368616e742d61"
              "69657870697265734174"
              "f6"
              "696661636556616c7565"
              "1903e8"
              "69766f75636865724964"
              "7824"
              "35353065383430302d653239622d343164342d613731362d34343636353534"
              "3430303030"
              "6c66616365446563696d616c73"
              "00"
              "6d69737375616e6365526174696f"
              "fb3ff0000000000000"
              "6f6261636b696e675374726174656779"
              "654649584544"
              "706d65726368616e744d65746164617461"
              "f6");
}

TEST(canonical_test, deterministic) {
    auto terms = evoucher::test::sample_terms();
    terms.m_merchant_metadata = "{\"z\":true,\"a\":[1,2]}";
    auto a = evoucher::canonical_encode(evoucher::test::make_secret(terms));
    terms.m_merchant_metadata = "{ \"a\" : [1, 2], \"z\" : true }";
    auto b = evoucher::canonical_encode(evoucher::test::make_secret(terms));
    ASSERT_EQ(a, b);
}

TEST(canonical_test, optional_fields_encoded) {
    auto terms = evoucher::test::sample_terms();
    terms.m_expires_at = 1700000000;
    terms.m_memo = "gift";
    auto plain = evoucher::canonical_encode(
        evoucher::test::make_secret(evoucher::test::sample_terms()));
    auto enc = evoucher::canonical_encode(evoucher::test::make_secret(terms));
    ASSERT_NE(plain, enc);
    // memo is the first key: "memo" -> "gift".
    ASSERT_EQ(enc.to_hex().substr(0, 22), "aa646d656d6f6467696674");
    // expiresAt as a 4-byte unsigned integer.
    ASSERT_NE(enc.to_hex().find("69657870697265734174" "1a6553f100"),
              std::string::npos);
}
