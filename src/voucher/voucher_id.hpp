// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef EVOUCHER_SRC_VOUCHER_VOUCHER_ID_H_
#define EVOUCHER_SRC_VOUCHER_VOUCHER_ID_H_

#include "util/common/random_source.hpp"

#include <array>
#include <optional>
#include <string>

namespace evoucher {
    /// Size of a voucher identifier, in bytes.
    static constexpr size_t voucher_id_len = 16;

    /// 128-bit globally unique voucher identifier.
    using voucher_id_t = std::array<unsigned char, voucher_id_len>;

    /// Formats a voucher ID as a lower-case hyphenated UUID
    /// (8-4-4-4-12 hex digits).
    auto format_voucher_id(const voucher_id_t& id) -> std::string;

    /// Parses a hyphenated UUID. Upper and lower case hex digits are
    /// accepted.
    /// \param str textual UUID.
    /// \return the voucher ID, or std::nullopt if the text is not a
    ///         well-formed UUID.
    auto parse_voucher_id(const std::string& str)
        -> std::optional<voucher_id_t>;

    /// Generates a random version 4 UUID.
    /// \param rng source of random bytes.
    /// \return a new voucher ID, or std::nullopt if the random source failed.
    auto generate_voucher_id(random_source& rng)
        -> std::optional<voucher_id_t>;
}

#endif // EVOUCHER_SRC_VOUCHER_VOUCHER_ID_H_
