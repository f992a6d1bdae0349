// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "signature.hpp"

#include "canonical.hpp"

#include <cstring>
#include <secp256k1.h>
#include <secp256k1_extrakeys.h>
#include <secp256k1_schnorrsig.h>

namespace evoucher {
    namespace {
        constexpr size_t aux_rand_len = 32;
    }

    signature_engine::signature_engine(std::shared_ptr<random_source> rng)
        : m_rng(std::move(rng)),
          m_secp(secp256k1_context_create(SECP256K1_CONTEXT_NONE),
                 &secp256k1_context_destroy) {
        // Without a seed the context stays unblinded but fully usable.
        const auto seed = m_rng->random_bytes<aux_rand_len>();
        if(seed.has_value()) {
            [[maybe_unused]] const auto ret
                = secp256k1_context_randomize(m_secp.get(), seed->data());
        }
    }

    auto signature_engine::sign(const voucher_secret& secret,
                                const privkey_t& privkey) const
        -> std::optional<signature_t> {
        secp256k1_keypair keypair{};
        if(secp256k1_keypair_create(m_secp.get(), &keypair, privkey.data())
           != 1) {
            return std::nullopt;
        }

        auto aux_rand = m_rng->random_bytes<aux_rand_len>();
        if(!aux_rand.has_value()) {
            return std::nullopt;
        }

        secp256k1_schnorrsig_extraparams extraparams
            = SECP256K1_SCHNORRSIG_EXTRAPARAMS_INIT;
        extraparams.ndata = aux_rand->data();

        const auto msg = canonical_encode(secret);
        auto sig = signature_t();
        if(secp256k1_schnorrsig_sign_custom(m_secp.get(),
                                            sig.data(),
                                            msg.c_ptr(),
                                            msg.size(),
                                            &keypair,
                                            &extraparams)
           != 1) {
            return std::nullopt;
        }
        return sig;
    }

    auto signature_engine::verify(const voucher_secret& secret,
                                  const signature_t& sig,
                                  const pubkey_t& pubkey) const -> bool {
        secp256k1_xonly_pubkey xpub{};
        if(secp256k1_xonly_pubkey_parse(m_secp.get(), &xpub, pubkey.data())
           != 1) {
            return false;
        }

        const auto msg = canonical_encode(secret);
        return secp256k1_schnorrsig_verify(m_secp.get(),
                                           sig.data(),
                                           msg.c_ptr(),
                                           msg.size(),
                                           &xpub)
            == 1;
    }

    auto signature_engine::verify(const voucher_secret& secret,
                                  const buffer& sig,
                                  const buffer& pubkey) const -> bool {
        if(sig.size() != sig_len || pubkey.size() != pubkey_len) {
            return false;
        }
        auto sig_arr = signature_t();
        std::memcpy(sig_arr.data(), sig.data(), sig_arr.size());
        auto key_arr = pubkey_t();
        std::memcpy(key_arr.data(), pubkey.data(), key_arr.size());
        return verify(secret, sig_arr, key_arr);
    }

    auto signature_engine::derive_pubkey(const privkey_t& privkey) const
        -> std::optional<pubkey_t> {
        return pubkey_from_privkey(privkey, m_secp.get());
    }

    auto signature_engine::is_valid_privkey(const privkey_t& privkey) const
        -> bool {
        return secp256k1_ec_seckey_verify(m_secp.get(), privkey.data()) == 1;
    }

    auto signature_engine::create_signed(const voucher_secret& secret,
                                         const privkey_t& privkey) const
        -> std::variant<signed_voucher, precondition_error> {
        const auto pubkey = derive_pubkey(privkey);
        if(!pubkey.has_value()) {
            return precondition_error{
                "Invalid private key: not a valid secp256k1 secret key"};
        }
        const auto sig = sign(secret, privkey);
        if(!sig.has_value()) {
            return precondition_error{
                "Failed to sign voucher: no signing randomness available"};
        }
        return signed_voucher(secret, sig.value(), pubkey.value());
    }
}
