// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "keys.hpp"

#include <secp256k1.h>
#include <secp256k1_extrakeys.h>

namespace evoucher {
    auto pubkey_from_privkey(const privkey_t& privkey,
                             const secp256k1_context* ctx)
        -> std::optional<pubkey_t> {
        secp256k1_keypair keypair{};
        if(::secp256k1_keypair_create(ctx, &keypair, privkey.data()) != 1) {
            return std::nullopt;
        }

        secp256k1_xonly_pubkey xpub{};
        if(::secp256k1_keypair_xonly_pub(ctx, &xpub, nullptr, &keypair)
           != 1) {
            return std::nullopt;
        }

        pubkey_t pubkey{};
        if(::secp256k1_xonly_pubkey_serialize(ctx, pubkey.data(), &xpub)
           != 1) {
            return std::nullopt;
        }
        return pubkey;
    }
}
