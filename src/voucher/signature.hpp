// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef EVOUCHER_SRC_VOUCHER_SIGNATURE_H_
#define EVOUCHER_SRC_VOUCHER_SIGNATURE_H_

#include "error.hpp"
#include "secret.hpp"
#include "signed_voucher.hpp"
#include "util/common/buffer.hpp"
#include "util/common/keys.hpp"
#include "util/common/random_source.hpp"

#include <memory>
#include <optional>
#include <variant>

namespace evoucher {
    /// \brief Signs and verifies voucher secrets with BIP-340 Schnorr
    ///        signatures over secp256k1.
    ///
    /// The message is the full canonical encoding of the secret. Every
    /// signature uses 32 bytes of fresh auxiliary randomness, so signing the
    /// same secret twice yields different signatures that both verify.
    /// Owns its secp256k1 context; one instance can be shared between
    /// threads.
    class signature_engine {
      public:
        /// Constructor. Creates and randomizes the secp256k1 context.
        /// \param rng source of auxiliary signing randomness.
        explicit signature_engine(std::shared_ptr<random_source> rng);

        ~signature_engine() = default;

        signature_engine(const signature_engine&) = delete;
        auto operator=(const signature_engine&) -> signature_engine& = delete;
        signature_engine(signature_engine&&) = delete;
        auto operator=(signature_engine&&) -> signature_engine& = delete;

        /// Signs the canonical encoding of a secret.
        /// \param secret voucher terms to sign.
        /// \param privkey issuer private key.
        /// \return 64-byte signature, or std::nullopt if the private key is
        ///         not a valid secp256k1 scalar or no randomness was
        ///         available.
        [[nodiscard]] auto sign(const voucher_secret& secret,
                                const privkey_t& privkey) const
            -> std::optional<signature_t>;

        /// Verifies a signature over the canonical encoding of a secret.
        /// \param secret voucher terms.
        /// \param sig signature to check.
        /// \param pubkey x-only issuer public key.
        /// \return true if the signature is valid. False for a malformed key
        ///         or a mismatch; never reports an error.
        [[nodiscard]] auto verify(const voucher_secret& secret,
                                  const signature_t& sig,
                                  const pubkey_t& pubkey) const -> bool;

        /// Verifies a signature given as variable-length buffers.
        /// \return false if either buffer has the wrong length, otherwise
        ///         as verify(const voucher_secret&, const signature_t&,
        ///         const pubkey_t&).
        [[nodiscard]] auto verify(const voucher_secret& secret,
                                  const buffer& sig,
                                  const buffer& pubkey) const -> bool;

        /// Derives the x-only public key of a private key.
        /// \return the public key, or std::nullopt for an invalid scalar.
        [[nodiscard]] auto derive_pubkey(const privkey_t& privkey) const
            -> std::optional<pubkey_t>;

        /// Checks whether a private key is a valid secp256k1 scalar.
        [[nodiscard]] auto is_valid_privkey(const privkey_t& privkey) const
            -> bool;

        /// Signs a secret and bundles it with the signature and the derived
        /// public key.
        /// \param secret voucher terms to sign.
        /// \param privkey issuer private key.
        /// \return the signed voucher, or a precondition error for an invalid
        ///         private key.
        [[nodiscard]] auto create_signed(const voucher_secret& secret,
                                         const privkey_t& privkey) const
            -> std::variant<signed_voucher, precondition_error>;

      private:
        using secp256k1_context_destroy_type = void (*)(secp256k1_context*);

        std::shared_ptr<random_source> m_rng;
        std::unique_ptr<secp256k1_context, secp256k1_context_destroy_type>
            m_secp;
    };
}

#endif // EVOUCHER_SRC_VOUCHER_SIGNATURE_H_
