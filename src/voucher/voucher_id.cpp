// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "voucher_id.hpp"

#include "util/common/buffer.hpp"

#include <cstring>

namespace evoucher {
    namespace {
        // Hex digit counts of the five UUID groups.
        constexpr std::array<size_t, 5> group_digits{8, 4, 4, 4, 12};
        constexpr size_t uuid_text_len = 36;

        constexpr size_t version_byte = 6;
        constexpr size_t variant_byte = 8;
        constexpr unsigned char version_4 = 0x40;
        constexpr unsigned char variant_rfc4122 = 0x80;
    }

    auto format_voucher_id(const voucher_id_t& id) -> std::string {
        auto buf = buffer();
        buf.append(id.data(), id.size());
        const auto hex = buf.to_hex();

        auto ret = std::string();
        ret.reserve(uuid_text_len);
        size_t pos = 0;
        for(size_t g = 0; g < group_digits.size(); g++) {
            if(g > 0) {
                ret.push_back('-');
            }
            ret.append(hex, pos, group_digits[g]);
            pos += group_digits[g];
        }
        return ret;
    }

    auto parse_voucher_id(const std::string& str)
        -> std::optional<voucher_id_t> {
        if(str.size() != uuid_text_len) {
            return std::nullopt;
        }

        auto hex = std::string();
        hex.reserve(voucher_id_len * 2);
        size_t pos = 0;
        for(size_t g = 0; g < group_digits.size(); g++) {
            if(g > 0) {
                if(str[pos] != '-') {
                    return std::nullopt;
                }
                pos++;
            }
            hex.append(str, pos, group_digits[g]);
            pos += group_digits[g];
        }

        // from_hex rejects any non-hex character, including stray hyphens.
        const auto buf = buffer::from_hex(hex);
        if(!buf.has_value() || buf->size() != voucher_id_len) {
            return std::nullopt;
        }
        auto ret = voucher_id_t();
        std::memcpy(ret.data(), buf->data(), ret.size());
        return ret;
    }

    auto generate_voucher_id(random_source& rng)
        -> std::optional<voucher_id_t> {
        auto ret = rng.random_bytes<voucher_id_len>();
        if(!ret.has_value()) {
            return std::nullopt;
        }
        auto& id = ret.value();
        id[version_byte]
            = static_cast<unsigned char>((id[version_byte] & 0x0fU)
                                         | version_4);
        id[variant_byte]
            = static_cast<unsigned char>((id[variant_byte] & 0x3fU)
                                         | variant_rfc4122);
        return ret;
    }
}
