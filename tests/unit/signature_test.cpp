// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "../util.hpp"
#include "voucher/signature.hpp"

#include <functional>
#include <gtest/gtest.h>

class signature_test : public ::testing::Test {
  protected:
    void SetUp() override {
        m_terms.m_expires_at = 1900000000;
        m_terms.m_memo = "birthday";
        m_terms.m_backing_strategy = evoucher::backing_strategy::proportional;
        m_terms.m_issuance_ratio = 0.5;
        m_terms.m_face_decimals = 2;
        m_terms.m_merchant_metadata = "{\"store\":\"north\"}";

        auto pub = m_engine->derive_pubkey(m_priv);
        ASSERT_TRUE(pub.has_value());
        m_pub = pub.value();

        auto sig = m_engine->sign(evoucher::test::make_secret(m_terms), m_priv);
        ASSERT_TRUE(sig.has_value());
        m_sig = sig.value();
    }

    std::shared_ptr<evoucher::signature_engine> m_engine{
        evoucher::test::make_engine()};
    evoucher::privkey_t m_priv{
        evoucher::test::privkey(evoucher::test::issuer_privkey_hex)};
    evoucher::pubkey_t m_pub{};
    evoucher::signature_t m_sig{};
    evoucher::voucher_terms m_terms{evoucher::test::sample_terms()};
};

TEST_F(signature_test, sign_then_verify) {
    auto secret = evoucher::test::make_secret(m_terms);
    ASSERT_TRUE(m_engine->verify(secret, m_sig, m_pub));
}

TEST_F(signature_test, signatures_are_randomized_but_both_verify) {
    auto secret = evoucher::test::make_secret(m_terms);
    auto other = m_engine->sign(secret, m_priv);
    ASSERT_TRUE(other.has_value());
    ASSERT_TRUE(m_engine->verify(secret, other.value(), m_pub));
}

TEST_F(signature_test, tampering_any_field_breaks_signature) {
    using mutation = std::function<void(evoucher::voucher_terms&)>;
    const auto mutations = std::vector<mutation>{
        [](auto& t) {
            t.m_voucher_id = evoucher::test::voucher_id(
                "550e8400-e29b-41d4-a716-446655440001");
        },
        [](auto& t) {
            t.m_issuer_id = "merchant-b";
        },
        [](auto& t) {
            t.m_unit = "usd";
        },
        [](auto& t) {
            t.m_face_value = 1001;
        },
        [](auto& t) {
            t.m_expires_at = 1900000001;
        },
        [](auto& t) {
            t.m_expires_at.reset();
        },
        [](auto& t) {
            t.m_memo = "birthdaY";
        },
        [](auto& t) {
            t.m_memo.reset();
        },
        [](auto& t) {
            t.m_backing_strategy = evoucher::backing_strategy::minimal;
        },
        [](auto& t) {
            t.m_issuance_ratio = 0.5000001;
        },
        [](auto& t) {
            t.m_face_decimals = 3;
        },
        [](auto& t) {
            t.m_merchant_metadata = "{\"store\":\"south\"}";
        },
        [](auto& t) {
            t.m_merchant_metadata.reset();
        }};

    for(size_t i = 0; i < mutations.size(); i++) {
        auto terms = m_terms;
        mutations[i](terms);
        auto tampered = evoucher::test::make_secret(terms);
        EXPECT_FALSE(m_engine->verify(tampered, m_sig, m_pub))
            << "mutation " << i << " went undetected";
    }
}

TEST_F(signature_test, wrong_key_fails) {
    auto other_pub = m_engine->derive_pubkey(
        evoucher::test::privkey(evoucher::test::other_privkey_hex));
    ASSERT_TRUE(other_pub.has_value());
    ASSERT_NE(other_pub.value(), m_pub);
    auto secret = evoucher::test::make_secret(m_terms);
    ASSERT_FALSE(m_engine->verify(secret, m_sig, other_pub.value()));
}

TEST_F(signature_test, malformed_inputs_never_verify) {
    auto secret = evoucher::test::make_secret(m_terms);

    auto short_sig = evoucher::buffer();
    short_sig.append(m_sig.data(), m_sig.size() - 1);
    auto pub = evoucher::buffer();
    pub.append(m_pub.data(), m_pub.size());
    ASSERT_FALSE(m_engine->verify(secret, short_sig, pub));

    auto sig = evoucher::buffer();
    sig.append(m_sig.data(), m_sig.size());
    ASSERT_TRUE(m_engine->verify(secret, sig, pub));
    ASSERT_FALSE(m_engine->verify(secret, sig, evoucher::buffer()));

    // Not an x coordinate on the curve.
    auto bad_pub = evoucher::pubkey_t();
    bad_pub.fill(0xff);
    ASSERT_FALSE(m_engine->verify(secret, m_sig, bad_pub));
}

TEST_F(signature_test, invalid_private_key) {
    auto zero = evoucher::privkey_t{};
    ASSERT_FALSE(m_engine->is_valid_privkey(zero));
    ASSERT_FALSE(m_engine->derive_pubkey(zero).has_value());
    ASSERT_FALSE(
        m_engine->sign(evoucher::test::make_secret(m_terms), zero).has_value());

    auto res
        = m_engine->create_signed(evoucher::test::make_secret(m_terms), zero);
    ASSERT_TRUE(std::holds_alternative<evoucher::precondition_error>(res));
    ASSERT_EQ(std::get<evoucher::precondition_error>(res).m_message,
              "Invalid private key: not a valid secp256k1 secret key");
}

TEST_F(signature_test, create_signed_uses_derived_key) {
    auto res = m_engine->create_signed(evoucher::test::make_secret(m_terms),
                                       m_priv);
    ASSERT_TRUE(std::holds_alternative<evoucher::signed_voucher>(res));
    const auto& voucher = std::get<evoucher::signed_voucher>(res);
    ASSERT_EQ(voucher.issuer_pubkey(), m_pub);
    ASSERT_TRUE(voucher.verify(*m_engine));
}
