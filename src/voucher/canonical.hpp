// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef EVOUCHER_SRC_VOUCHER_CANONICAL_H_
#define EVOUCHER_SRC_VOUCHER_CANONICAL_H_

#include "secret.hpp"
#include "util/common/buffer.hpp"

namespace evoucher {
    /// \brief Deterministic encoding of a voucher secret.
    ///
    /// Produces a single CBOR map with ten text keys in core deterministic
    /// order: memo, unit, issuerId, expiresAt, faceValue, voucherId,
    /// faceDecimals, issuanceRatio, backingStrategy, merchantMetadata.
    /// Absent memo, expiry and metadata are encoded as null, integers use
    /// their shortest form and the issuance ratio is always an 8-byte
    /// float. The result is the exact message the issuer signs, so any
    /// implementation must reproduce it byte for byte.
    /// \param secret voucher terms to encode.
    /// \return encoded bytes.
    auto canonical_encode(const voucher_secret& secret) -> buffer;
}

#endif // EVOUCHER_SRC_VOUCHER_CANONICAL_H_
