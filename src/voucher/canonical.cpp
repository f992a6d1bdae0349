// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "canonical.hpp"

#include "util/serialization/buffer_serializer.hpp"
#include "util/serialization/cbor.hpp"

namespace evoucher {
    namespace {
        void write_optional_text(cbor::writer& w,
                                 const std::optional<std::string>& val) {
            if(val.has_value()) {
                w.write_text(val.value());
            } else {
                w.write_null();
            }
        }
    }

    auto canonical_encode(const voucher_secret& secret) -> buffer {
        auto map = cbor::canonical_map();
        map.add("voucherId", [&](cbor::writer& w) {
            w.write_text(format_voucher_id(secret.voucher_id()));
        });
        map.add("issuerId", [&](cbor::writer& w) {
            w.write_text(secret.issuer_id());
        });
        map.add("unit", [&](cbor::writer& w) {
            w.write_text(secret.unit());
        });
        map.add("faceValue", [&](cbor::writer& w) {
            w.write_int(secret.face_value());
        });
        map.add("expiresAt", [&](cbor::writer& w) {
            if(secret.expires_at().has_value()) {
                w.write_int(secret.expires_at().value());
            } else {
                w.write_null();
            }
        });
        map.add("memo", [&](cbor::writer& w) {
            write_optional_text(w, secret.memo());
        });
        map.add("backingStrategy", [&](cbor::writer& w) {
            w.write_text(to_string(secret.get_backing_strategy()));
        });
        map.add("issuanceRatio", [&](cbor::writer& w) {
            w.write_double(secret.issuance_ratio());
        });
        map.add("faceDecimals", [&](cbor::writer& w) {
            w.write_int(secret.face_decimals());
        });
        map.add("merchantMetadata", [&](cbor::writer& w) {
            write_optional_text(w, secret.merchant_metadata());
        });

        auto ret = buffer();
        auto ser = buffer_serializer(ret);
        auto w = cbor::writer(ser);
        map.write_to(w);
        return ret;
    }
}
