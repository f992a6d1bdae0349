// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef EVOUCHER_SRC_VOUCHER_SIGNED_VOUCHER_H_
#define EVOUCHER_SRC_VOUCHER_SIGNED_VOUCHER_H_

#include "error.hpp"
#include "secret.hpp"
#include "util/common/buffer.hpp"
#include "util/common/keys.hpp"

#include <variant>

namespace evoucher {
    class signature_engine;

    /// \brief A voucher secret bundled with its issuer signature and the
    ///        issuer's public key.
    ///
    /// Immutable. The signature is held by value; accessors return copies,
    /// so nothing a caller does with a returned or supplied byte array can
    /// alter the stored signature.
    class signed_voucher {
      public:
        /// Constructor.
        /// \param secret signed voucher terms.
        /// \param signature BIP-340 signature over the canonical encoding of
        ///                  the secret.
        /// \param issuer_pubkey x-only public key of the issuer.
        signed_voucher(voucher_secret secret,
                       const signature_t& signature,
                       const pubkey_t& issuer_pubkey);

        /// Builds a signed voucher from variable-length inputs, checking
        /// their lengths.
        /// \param secret signed voucher terms.
        /// \param signature signature bytes; must be exactly 64 bytes.
        /// \param issuer_pubkey public key bytes; must be non-empty and
        ///                      exactly 32 bytes.
        /// \return the signed voucher, or the violated precondition.
        static auto create(voucher_secret secret,
                           const buffer& signature,
                           const buffer& issuer_pubkey)
            -> std::variant<signed_voucher, precondition_error>;

        /// Returns the signed terms.
        [[nodiscard]] auto secret() const -> const voucher_secret&;

        /// Returns a copy of the issuer signature.
        [[nodiscard]] auto signature() const -> signature_t;

        /// Returns a copy of the issuer public key.
        [[nodiscard]] auto issuer_pubkey() const -> pubkey_t;

        /// Checks the issuer signature against the canonical encoding of
        /// the secret.
        /// \param engine signature engine to verify with.
        /// \return true if the signature is valid.
        [[nodiscard]] auto verify(const signature_engine& engine) const
            -> bool;

        /// Indicates whether the voucher has an expiry at or before the
        /// given time. A voucher without expiry never expires.
        /// \param now current time in Unix seconds.
        [[nodiscard]] auto is_expired(int64_t now) const -> bool;

        /// \see is_expired(int64_t) with the current wall-clock time.
        [[nodiscard]] auto is_expired() const -> bool;

        /// Returns verify(engine) && !is_expired(now).
        [[nodiscard]] auto is_valid(const signature_engine& engine,
                                    int64_t now) const -> bool;

        /// \see is_valid(const signature_engine&, int64_t) with the current
        ///      wall-clock time.
        [[nodiscard]] auto is_valid(const signature_engine& engine) const
            -> bool;

        [[nodiscard]] auto voucher_id() const -> const voucher_id_t&;
        [[nodiscard]] auto issuer_id() const -> const std::string&;
        [[nodiscard]] auto unit() const -> const std::string&;
        [[nodiscard]] auto face_value() const -> int64_t;
        [[nodiscard]] auto expires_at() const -> const std::optional<int64_t>&;
        [[nodiscard]] auto memo() const -> const std::optional<std::string>&;
        [[nodiscard]] auto get_backing_strategy() const -> backing_strategy;
        [[nodiscard]] auto issuance_ratio() const -> double;
        [[nodiscard]] auto face_decimals() const -> int32_t;

        /// Short one-line description for log output.
        [[nodiscard]] auto to_string() const -> std::string;

        /// Description listing every field, for diagnostics.
        [[nodiscard]] auto to_detailed_string() const -> std::string;

        auto operator==(const signed_voucher& rhs) const -> bool;
        auto operator!=(const signed_voucher& rhs) const -> bool;

      private:
        voucher_secret m_secret;
        signature_t m_signature;
        pubkey_t m_issuer_pubkey;
    };

    /// Hash function for signed vouchers, consistent with equality.
    struct signed_voucher_hasher {
        auto operator()(const signed_voucher& voucher) const noexcept
            -> size_t;
    };
}

#endif // EVOUCHER_SRC_VOUCHER_SIGNED_VOUCHER_H_
