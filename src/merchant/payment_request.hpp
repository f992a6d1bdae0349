// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/** \file payment_request.hpp
 *  NUT-18V payment requests, which a merchant hands to a customer, and the
 *  payment payloads a customer sends back in response.
 */

#ifndef EVOUCHER_SRC_MERCHANT_PAYMENT_REQUEST_H_
#define EVOUCHER_SRC_MERCHANT_PAYMENT_REQUEST_H_

#include "util/common/random_source.hpp"
#include "voucher/error.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace evoucher::merchant {
    /// Channels over which a customer can deliver a payment payload.
    enum class transport_type : uint8_t {
        /// Deliver directly to the issuing merchant.
        merchant,
        /// HTTP POST to a callback URL.
        http_post,
        /// Nostr NIP-17 direct message.
        nostr
    };

    /// Returns the NUT-18 name of a transport type.
    auto to_string(transport_type type) -> std::string;

    /// A single payment delivery channel.
    struct transport {
        /// Channel kind.
        transport_type m_type{transport_type::merchant};
        /// Channel address: merchant target, URL or nprofile.
        std::string m_target;
        /// Channel-specific tags, each a name followed by values.
        std::vector<std::vector<std::string>> m_tags;

        /// Builds a direct-to-merchant transport.
        static auto merchant(std::string target, const std::string& issuer_id)
            -> transport;
        /// Builds an HTTP POST transport.
        static auto http_post(std::string url) -> transport;
        /// Builds a Nostr NIP-17 transport.
        static auto nostr_nip17(std::string nprofile) -> transport;

        auto operator==(const transport& rhs) const -> bool;
    };

    /// \brief A merchant's request for a voucher payment.
    struct payment_request {
        /// Identifier the payload must echo, if any.
        std::optional<std::string> m_payment_id;
        /// Merchant whose vouchers are accepted.
        std::string m_issuer_id;
        /// Minimum amount requested, if any.
        std::optional<int64_t> m_amount;
        /// Unit of the requested amount.
        std::optional<std::string> m_unit;
        /// Human-readable description.
        std::optional<std::string> m_description;
        /// Mints the payment may come from. Empty means any mint.
        std::vector<std::string> m_mints;
        /// Whether the request may only be paid once.
        std::optional<bool> m_single_use;
        /// Whether every proof must carry DLEQ data.
        bool m_offline_verification{false};
        /// Absolute expiry in Unix seconds, if any.
        std::optional<int64_t> m_expires_at;
        /// Delivery channels, in order of preference.
        std::vector<transport> m_transports;

        /// Checks whether a mint may be used to pay this request.
        [[nodiscard]] auto is_mint_permitted(const std::string& mint) const
            -> bool;
    };

    /// Discrete-log equality proof attached to a token proof.
    struct dleq {
        std::string m_e;
        std::string m_s;
        std::string m_r;
    };

    /// A token proof included in a payment payload.
    struct proof {
        int64_t m_amount{};
        std::string m_keyset_id;
        std::string m_secret;
        std::string m_signature;
        std::optional<dleq> m_dleq;
    };

    /// \brief A customer's response to a payment request.
    struct payment_payload {
        /// Echo of the request's payment ID.
        std::string m_id;
        /// Merchant the vouchers were issued by.
        std::string m_issuer_id;
        /// Mint the proofs come from.
        std::string m_mint;
        /// Unit of the proofs.
        std::string m_unit;
        std::optional<std::string> m_memo;
        std::vector<proof> m_proofs;

        /// Returns the sum of all proof amounts.
        /// \return the total, or std::nullopt if any proof amount is not
        ///         positive or the sum does not fit in an int64_t.
        [[nodiscard]] auto total_amount() const -> std::optional<int64_t>;

        /// Indicates whether every proof carries DLEQ data.
        [[nodiscard]] auto all_proofs_have_dleq() const -> bool;

        [[nodiscard]] auto proof_count() const -> size_t;
    };

    /// Parameters for \ref generate_payment_request.
    struct payment_request_params {
        /// Merchant requesting payment. Required.
        std::string m_issuer_id;
        /// Payment ID; generated when absent or blank.
        std::optional<std::string> m_payment_id;
        std::optional<int64_t> m_amount;
        /// Required whenever an amount is given.
        std::optional<std::string> m_unit;
        std::optional<std::string> m_description;
        std::optional<bool> m_single_use;
        bool m_offline_verification{false};
        std::optional<int64_t> m_expires_at;
        std::vector<std::string> m_mints;
        /// Adds an HTTP POST transport when set.
        std::optional<std::string> m_callback_url;
        /// Adds a Nostr NIP-17 transport when set.
        std::optional<std::string> m_nostr_nprofile;
        /// Adds a direct-to-merchant transport.
        bool m_include_merchant_transport{true};
    };

    /// Length of a generated payment ID in hex digits.
    static constexpr size_t payment_id_len = 8;

    /// \brief Builds a payment request.
    ///
    /// Transports are added in a fixed order: merchant, HTTP POST, then
    /// Nostr.
    /// \param params request parameters.
    /// \param rng source used to generate a missing payment ID.
    /// \return the request, a precondition error for missing fields, or an
    ///         operational error if no payment ID could be generated.
    auto generate_payment_request(const payment_request_params& params,
                                  random_source& rng)
        -> std::variant<payment_request, precondition_error, operational_error>;
}

#endif // EVOUCHER_SRC_MERCHANT_PAYMENT_REQUEST_H_
