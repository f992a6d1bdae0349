// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "secret.hpp"

#include "metadata.hpp"
#include "util/common/strings.hpp"

#include <cmath>
#include <sstream>
#include <tuple>

namespace evoucher {
    auto to_string(backing_strategy strategy) -> std::string {
        switch(strategy) {
            case backing_strategy::fixed:
                return "FIXED";
            case backing_strategy::minimal:
                return "MINIMAL";
            case backing_strategy::proportional:
                return "PROPORTIONAL";
        }
        return "FIXED";
    }

    auto parse_backing_strategy(const std::string& name)
        -> std::optional<backing_strategy> {
        if(name == "FIXED") {
            return backing_strategy::fixed;
        }
        if(name == "MINIMAL") {
            return backing_strategy::minimal;
        }
        if(name == "PROPORTIONAL") {
            return backing_strategy::proportional;
        }
        return std::nullopt;
    }

    auto is_splittable(backing_strategy strategy) -> bool {
        return strategy != backing_strategy::fixed;
    }

    auto has_fine_grained_splits(backing_strategy strategy) -> bool {
        return strategy == backing_strategy::proportional;
    }

    voucher_secret::voucher_secret(voucher_terms terms)
        : m_terms(std::move(terms)) {}

    auto voucher_secret::create(voucher_terms terms)
        -> std::variant<voucher_secret, precondition_error> {
        if(terms.m_face_value <= 0) {
            return precondition_error{"Face value must be positive, got: "
                                      + std::to_string(terms.m_face_value)};
        }
        if(is_blank(terms.m_issuer_id)) {
            return precondition_error{"Issuer ID cannot be blank"};
        }
        if(is_blank(terms.m_unit)) {
            return precondition_error{"Unit cannot be blank"};
        }
        if(terms.m_expires_at.has_value() && terms.m_expires_at.value() <= 0) {
            return precondition_error{
                "Expiry timestamp must be positive if provided"};
        }
        if(!std::isfinite(terms.m_issuance_ratio)
           || terms.m_issuance_ratio <= 0.0) {
            auto ss = std::stringstream();
            ss << "Issuance ratio must be positive, got: "
               << terms.m_issuance_ratio;
            return precondition_error{ss.str()};
        }
        if(terms.m_face_decimals < 0) {
            return precondition_error{"Face decimals cannot be negative, got: "
                                      + std::to_string(terms.m_face_decimals)};
        }

        if(terms.m_memo.has_value() && is_blank(terms.m_memo.value())) {
            terms.m_memo.reset();
        }

        if(terms.m_merchant_metadata.has_value()) {
            if(is_blank(terms.m_merchant_metadata.value())) {
                terms.m_merchant_metadata.reset();
            } else {
                const auto parsed
                    = parse_metadata(terms.m_merchant_metadata.value());
                if(!parsed.has_value()) {
                    return precondition_error{
                        "Merchant metadata must be a JSON object"};
                }
                terms.m_merchant_metadata = metadata_to_text(parsed.value());
            }
        }

        return voucher_secret(std::move(terms));
    }

    auto voucher_secret::voucher_id() const -> const voucher_id_t& {
        return m_terms.m_voucher_id;
    }

    auto voucher_secret::issuer_id() const -> const std::string& {
        return m_terms.m_issuer_id;
    }

    auto voucher_secret::unit() const -> const std::string& {
        return m_terms.m_unit;
    }

    auto voucher_secret::face_value() const -> int64_t {
        return m_terms.m_face_value;
    }

    auto voucher_secret::expires_at() const -> const std::optional<int64_t>& {
        return m_terms.m_expires_at;
    }

    auto voucher_secret::memo() const -> const std::optional<std::string>& {
        return m_terms.m_memo;
    }

    auto voucher_secret::get_backing_strategy() const -> backing_strategy {
        return m_terms.m_backing_strategy;
    }

    auto voucher_secret::issuance_ratio() const -> double {
        return m_terms.m_issuance_ratio;
    }

    auto voucher_secret::face_decimals() const -> int32_t {
        return m_terms.m_face_decimals;
    }

    auto voucher_secret::merchant_metadata() const
        -> const std::optional<std::string>& {
        return m_terms.m_merchant_metadata;
    }

    auto voucher_secret::terms() const -> const voucher_terms& {
        return m_terms;
    }

    auto voucher_secret::operator==(const voucher_secret& rhs) const -> bool {
        const auto& l = m_terms;
        const auto& r = rhs.m_terms;
        return std::tie(l.m_voucher_id,
                        l.m_issuer_id,
                        l.m_unit,
                        l.m_face_value,
                        l.m_expires_at,
                        l.m_memo,
                        l.m_backing_strategy,
                        l.m_issuance_ratio,
                        l.m_face_decimals,
                        l.m_merchant_metadata)
            == std::tie(r.m_voucher_id,
                        r.m_issuer_id,
                        r.m_unit,
                        r.m_face_value,
                        r.m_expires_at,
                        r.m_memo,
                        r.m_backing_strategy,
                        r.m_issuance_ratio,
                        r.m_face_decimals,
                        r.m_merchant_metadata);
    }

    auto voucher_secret::operator!=(const voucher_secret& rhs) const -> bool {
        return !(*this == rhs);
    }
}
