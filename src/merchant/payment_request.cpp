// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "payment_request.hpp"

#include "util/common/keys.hpp"
#include "util/common/strings.hpp"

#include <algorithm>
#include <limits>
#include <tuple>

namespace evoucher::merchant {
    auto to_string(transport_type type) -> std::string {
        switch(type) {
            case transport_type::merchant:
                return "merchant";
            case transport_type::http_post:
                return "post";
            case transport_type::nostr:
                return "nostr";
        }
        return "unknown";
    }

    auto transport::merchant(std::string target, const std::string& issuer_id)
        -> transport {
        return transport{transport_type::merchant,
                         std::move(target),
                         {{"issuer", issuer_id}}};
    }

    auto transport::http_post(std::string url) -> transport {
        return transport{transport_type::http_post, std::move(url), {}};
    }

    auto transport::nostr_nip17(std::string nprofile) -> transport {
        return transport{transport_type::nostr,
                         std::move(nprofile),
                         {{"n", "17"}}};
    }

    auto transport::operator==(const transport& rhs) const -> bool {
        return std::tie(m_type, m_target, m_tags)
            == std::tie(rhs.m_type, rhs.m_target, rhs.m_tags);
    }

    auto payment_request::is_mint_permitted(const std::string& mint) const
        -> bool {
        if(m_mints.empty()) {
            return true;
        }
        return std::find(m_mints.begin(), m_mints.end(), mint)
            != m_mints.end();
    }

    auto payment_payload::total_amount() const -> std::optional<int64_t> {
        int64_t total{0};
        for(const auto& p : m_proofs) {
            if(p.m_amount <= 0
               || p.m_amount > std::numeric_limits<int64_t>::max() - total) {
                return std::nullopt;
            }
            total += p.m_amount;
        }
        return total;
    }

    auto payment_payload::all_proofs_have_dleq() const -> bool {
        return std::all_of(m_proofs.begin(),
                           m_proofs.end(),
                           [](const proof& p) {
                               return p.m_dleq.has_value();
                           });
    }

    auto payment_payload::proof_count() const -> size_t {
        return m_proofs.size();
    }

    namespace {
        auto is_set(const std::optional<std::string>& value) -> bool {
            return value.has_value() && !is_blank(value.value());
        }
    }

    auto generate_payment_request(const payment_request_params& params,
                                  random_source& rng)
        -> std::variant<payment_request, precondition_error, operational_error> {
        if(is_blank(params.m_issuer_id)) {
            return precondition_error{
                "Issuer ID is required for payment request"};
        }
        if(params.m_amount.has_value() && !is_set(params.m_unit)) {
            return precondition_error{
                "Unit is required when amount is specified"};
        }

        auto req = payment_request();
        if(is_set(params.m_payment_id)) {
            req.m_payment_id = params.m_payment_id;
        } else {
            auto bytes = rng.random_bytes<payment_id_len / 2>();
            if(!bytes.has_value()) {
                return operational_error{
                    "Failed to generate payment ID: no randomness available"};
            }
            req.m_payment_id = to_hex(bytes.value());
        }

        req.m_issuer_id = params.m_issuer_id;
        req.m_amount = params.m_amount;
        req.m_unit = params.m_unit;
        req.m_description = params.m_description;
        req.m_mints = params.m_mints;
        req.m_single_use = params.m_single_use;
        req.m_offline_verification = params.m_offline_verification;
        req.m_expires_at = params.m_expires_at;

        if(params.m_include_merchant_transport) {
            req.m_transports.push_back(
                transport::merchant("merchant:" + params.m_issuer_id,
                                    params.m_issuer_id));
        }
        if(is_set(params.m_callback_url)) {
            req.m_transports.push_back(
                transport::http_post(params.m_callback_url.value()));
        }
        if(is_set(params.m_nostr_nprofile)) {
            req.m_transports.push_back(
                transport::nostr_nip17(params.m_nostr_nprofile.value()));
        }

        return req;
    }
}
