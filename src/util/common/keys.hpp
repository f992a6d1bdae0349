// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef EVOUCHER_SRC_UTIL_COMMON_KEYS_H_
#define EVOUCHER_SRC_UTIL_COMMON_KEYS_H_

#include "buffer.hpp"

#include <array>
#include <cstring>
#include <optional>
#include <string>

struct secp256k1_context_struct;
using secp256k1_context = struct secp256k1_context_struct;

namespace evoucher {
    /// Size of public keys used throughout the system, in bytes.
    static constexpr size_t pubkey_len = 32;
    /// Size of private keys used throughout the system, in bytes.
    static constexpr size_t privkey_len = 32;
    /// Size of signatures used throughout the system, in bytes.
    static constexpr size_t sig_len = 64;

    /// A private key of a public/private keypair.
    using privkey_t = std::array<unsigned char, privkey_len>;
    /// An x-only public key of a public/private keypair.
    using pubkey_t = std::array<unsigned char, pubkey_len>;
    /// A BIP-340 Schnorr signature.
    using signature_t = std::array<unsigned char, sig_len>;

    /// Generates a public key from the specified private key.
    /// \param privkey private key for which to generate the public key.
    /// \param ctx the secp context to use.
    /// \return the x-only public key, or std::nullopt if the private key is
    ///         not a valid secp256k1 scalar.
    auto pubkey_from_privkey(const privkey_t& privkey,
                             const secp256k1_context* ctx)
        -> std::optional<pubkey_t>;

    /// Returns the lower-case hex representation of a fixed-size key or
    /// signature.
    template<size_t S>
    auto to_hex(const std::array<unsigned char, S>& arr) -> std::string {
        auto buf = buffer();
        buf.append(arr.data(), S);
        return buf.to_hex();
    }

    /// Parses a hex string holding exactly S bytes.
    /// \tparam S expected number of bytes.
    /// \param hex hex string to parse.
    /// \return the parsed bytes, or std::nullopt if the string is not valid
    ///         hex or does not decode to exactly S bytes.
    template<size_t S>
    auto array_from_hex(const std::string& hex)
        -> std::optional<std::array<unsigned char, S>> {
        const auto buf = buffer::from_hex(hex);
        if(!buf.has_value() || buf->size() != S) {
            return std::nullopt;
        }
        auto ret = std::array<unsigned char, S>();
        std::memcpy(ret.data(), buf->data(), S);
        return ret;
    }
}

#endif // EVOUCHER_SRC_UTIL_COMMON_KEYS_H_
