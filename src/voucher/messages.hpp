// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef EVOUCHER_SRC_VOUCHER_MESSAGES_H_
#define EVOUCHER_SRC_VOUCHER_MESSAGES_H_

#include "secret.hpp"
#include "signed_voucher.hpp"
#include "util/serialization/serializer.hpp"

#include <optional>
#include <vector>

namespace evoucher {
    /// \brief Serializes voucher terms.
    ///
    /// Serializes the voucher ID, issuer ID, unit, face value, expiry, memo,
    /// backing strategy, issuance ratio, face decimals and then the merchant
    /// metadata.
    /// \see \ref evoucher::operator<<(serializer&, const std::optional<T>&)
    /// \see \ref evoucher::operator<<(serializer&, const std::string&)
    auto operator<<(serializer& packet, const voucher_terms& terms)
        -> serializer&;

    /// Deserializes voucher terms without checking their invariants.
    /// \see \ref evoucher::operator<<(serializer&, const voucher_terms&)
    auto operator>>(serializer& packet, voucher_terms& terms) -> serializer&;

    /// Serializes the terms of a voucher secret.
    /// \see \ref evoucher::operator<<(serializer&, const voucher_terms&)
    auto operator<<(serializer& packet, const voucher_secret& secret)
        -> serializer&;

    /// \brief Serializes a signed voucher.
    ///
    /// Serializes the secret, then the signature, and then the issuer public
    /// key.
    auto operator<<(serializer& packet, const signed_voucher& voucher)
        -> serializer&;

    /// Deserializes a voucher secret and checks its invariants.
    /// \param packet serializer positioned at a serialized secret.
    /// \return the secret, or std::nullopt if the data is truncated or
    ///         describes an invalid secret.
    auto deserialize_voucher_secret(serializer& packet)
        -> std::optional<voucher_secret>;

    /// Deserializes a signed voucher.
    /// \see deserialize_voucher_secret
    auto deserialize_signed_voucher(serializer& packet)
        -> std::optional<signed_voucher>;

    /// Deserializes a length-prefixed list of signed vouchers, as written
    /// by \ref evoucher::operator<<(serializer&, const std::vector<T>&).
    /// \return every voucher, or std::nullopt if any one fails to
    ///         deserialize.
    auto deserialize_signed_vouchers(serializer& packet)
        -> std::optional<std::vector<signed_voucher>>;
}

#endif // EVOUCHER_SRC_VOUCHER_MESSAGES_H_
