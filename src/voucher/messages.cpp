// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "messages.hpp"

#include "util/serialization/format.hpp"

namespace evoucher {
    auto operator<<(serializer& packet, const voucher_terms& terms)
        -> serializer& {
        return packet << terms.m_voucher_id << terms.m_issuer_id
                      << terms.m_unit << terms.m_face_value
                      << terms.m_expires_at << terms.m_memo
                      << terms.m_backing_strategy << terms.m_issuance_ratio
                      << terms.m_face_decimals << terms.m_merchant_metadata;
    }

    auto operator>>(serializer& packet, voucher_terms& terms) -> serializer& {
        return packet >> terms.m_voucher_id >> terms.m_issuer_id
            >> terms.m_unit >> terms.m_face_value >> terms.m_expires_at
            >> terms.m_memo >> terms.m_backing_strategy
            >> terms.m_issuance_ratio >> terms.m_face_decimals
            >> terms.m_merchant_metadata;
    }

    auto operator<<(serializer& packet, const voucher_secret& secret)
        -> serializer& {
        return packet << secret.terms();
    }

    auto operator<<(serializer& packet, const signed_voucher& voucher)
        -> serializer& {
        return packet << voucher.secret() << voucher.signature()
                      << voucher.issuer_pubkey();
    }

    auto deserialize_voucher_secret(serializer& packet)
        -> std::optional<voucher_secret> {
        auto terms = voucher_terms();
        if(!(packet >> terms)) {
            return std::nullopt;
        }
        if(terms.m_backing_strategy > backing_strategy::proportional) {
            return std::nullopt;
        }
        auto secret = voucher_secret::create(std::move(terms));
        if(std::holds_alternative<precondition_error>(secret)) {
            return std::nullopt;
        }
        return std::get<voucher_secret>(std::move(secret));
    }

    auto deserialize_signed_voucher(serializer& packet)
        -> std::optional<signed_voucher> {
        auto secret = deserialize_voucher_secret(packet);
        if(!secret.has_value()) {
            return std::nullopt;
        }
        auto sig = signature_t();
        auto key = pubkey_t();
        if(!(packet >> sig >> key)) {
            return std::nullopt;
        }
        return signed_voucher(std::move(secret.value()), sig, key);
    }

    auto deserialize_signed_vouchers(serializer& packet)
        -> std::optional<std::vector<signed_voucher>> {
        uint64_t len{};
        if(!(packet >> len)) {
            return std::nullopt;
        }
        auto ret = std::vector<signed_voucher>();
        for(uint64_t i = 0; i < len; i++) {
            auto voucher = deserialize_signed_voucher(packet);
            if(!voucher.has_value()) {
                return std::nullopt;
            }
            ret.push_back(std::move(voucher.value()));
        }
        return ret;
    }
}
