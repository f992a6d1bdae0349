// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "signed_voucher.hpp"

#include "signature.hpp"
#include "util/common/clock.hpp"

#include <cstring>
#include <functional>
#include <sstream>

namespace evoucher {
    namespace {
        // Number of public key hex digits shown in the short description.
        constexpr size_t pubkey_preview_len = 16;
    }

    signed_voucher::signed_voucher(voucher_secret secret,
                                   const signature_t& signature,
                                   const pubkey_t& issuer_pubkey)
        : m_secret(std::move(secret)),
          m_signature(signature),
          m_issuer_pubkey(issuer_pubkey) {}

    auto signed_voucher::create(voucher_secret secret,
                                const buffer& signature,
                                const buffer& issuer_pubkey)
        -> std::variant<signed_voucher, precondition_error> {
        if(signature.size() != sig_len) {
            return precondition_error{
                "Invalid signature length: expected 64 bytes (Schnorr), got "
                + std::to_string(signature.size())};
        }
        if(issuer_pubkey.size() == 0) {
            return precondition_error{"Issuer public key cannot be blank"};
        }
        if(issuer_pubkey.size() != pubkey_len) {
            return precondition_error{
                "Invalid issuer public key length: expected 32 bytes, got "
                + std::to_string(issuer_pubkey.size())};
        }

        auto sig = signature_t();
        std::memcpy(sig.data(), signature.data(), sig.size());
        auto key = pubkey_t();
        std::memcpy(key.data(), issuer_pubkey.data(), key.size());
        return signed_voucher(std::move(secret), sig, key);
    }

    auto signed_voucher::secret() const -> const voucher_secret& {
        return m_secret;
    }

    auto signed_voucher::signature() const -> signature_t {
        return m_signature;
    }

    auto signed_voucher::issuer_pubkey() const -> pubkey_t {
        return m_issuer_pubkey;
    }

    auto signed_voucher::verify(const signature_engine& engine) const
        -> bool {
        return engine.verify(m_secret, m_signature, m_issuer_pubkey);
    }

    auto signed_voucher::is_expired(int64_t now) const -> bool {
        const auto& expires_at = m_secret.expires_at();
        return expires_at.has_value() && expires_at.value() <= now;
    }

    auto signed_voucher::is_expired() const -> bool {
        return is_expired(unix_time_now());
    }

    auto signed_voucher::is_valid(const signature_engine& engine,
                                  int64_t now) const -> bool {
        return verify(engine) && !is_expired(now);
    }

    auto signed_voucher::is_valid(const signature_engine& engine) const
        -> bool {
        return is_valid(engine, unix_time_now());
    }

    auto signed_voucher::voucher_id() const -> const voucher_id_t& {
        return m_secret.voucher_id();
    }

    auto signed_voucher::issuer_id() const -> const std::string& {
        return m_secret.issuer_id();
    }

    auto signed_voucher::unit() const -> const std::string& {
        return m_secret.unit();
    }

    auto signed_voucher::face_value() const -> int64_t {
        return m_secret.face_value();
    }

    auto signed_voucher::expires_at() const -> const std::optional<int64_t>& {
        return m_secret.expires_at();
    }

    auto signed_voucher::memo() const -> const std::optional<std::string>& {
        return m_secret.memo();
    }

    auto signed_voucher::get_backing_strategy() const -> backing_strategy {
        return m_secret.get_backing_strategy();
    }

    auto signed_voucher::issuance_ratio() const -> double {
        return m_secret.issuance_ratio();
    }

    auto signed_voucher::face_decimals() const -> int32_t {
        return m_secret.face_decimals();
    }

    auto signed_voucher::to_string() const -> std::string {
        auto ss = std::stringstream();
        ss << "signed_voucher{voucher_id=" << format_voucher_id(voucher_id())
           << ", issuer_id='" << issuer_id() << "', face_value="
           << face_value() << ", unit='" << unit()
           << "', expired=" << (is_expired() ? "true" : "false")
           << ", issuer_pubkey='"
           << to_hex(m_issuer_pubkey).substr(0, pubkey_preview_len)
           << "...'}";
        return ss.str();
    }

    auto signed_voucher::to_detailed_string() const -> std::string {
        auto ss = std::stringstream();
        ss << "signed_voucher{voucher_id=" << format_voucher_id(voucher_id())
           << ", issuer_id='" << issuer_id() << "', unit='" << unit()
           << "', face_value=" << face_value()
           << ", face_decimals=" << face_decimals()
           << ", backing_strategy="
           << evoucher::to_string(get_backing_strategy())
           << ", issuance_ratio=" << issuance_ratio() << ", expires_at=";
        if(expires_at().has_value()) {
            ss << expires_at().value();
        } else {
            ss << "none";
        }
        ss << ", memo='" << memo().value_or("") << "', issuer_pubkey='"
           << to_hex(m_issuer_pubkey) << "'}";
        return ss.str();
    }

    auto signed_voucher::operator==(const signed_voucher& rhs) const -> bool {
        return m_secret == rhs.m_secret && m_signature == rhs.m_signature
            && m_issuer_pubkey == rhs.m_issuer_pubkey;
    }

    auto signed_voucher::operator!=(const signed_voucher& rhs) const -> bool {
        return !(*this == rhs);
    }

    auto signed_voucher_hasher::operator()(
        const signed_voucher& voucher) const noexcept -> size_t {
        // The id and signature already determine the voucher for all
        // practical purposes. Both are uniformly random in their leading
        // bytes.
        static_assert(sizeof(size_t) <= voucher_id_len);
        static_assert(sizeof(size_t) <= sig_len);
        const auto sig = voucher.signature();
        size_t id_part{};
        std::memcpy(&id_part, voucher.voucher_id().data(), sizeof(id_part));
        size_t sig_part{};
        std::memcpy(&sig_part, sig.data(), sizeof(sig_part));
        constexpr auto golden = static_cast<size_t>(0x9e3779b97f4a7c15ULL);
        return id_part
             ^ (sig_part + golden + (id_part << 6U) + (id_part >> 2U));
    }
}
