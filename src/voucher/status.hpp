// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef EVOUCHER_SRC_VOUCHER_STATUS_H_
#define EVOUCHER_SRC_VOUCHER_STATUS_H_

#include <cstdint>
#include <string>

namespace evoucher {
    /// Lifecycle state of a voucher as recorded in the public ledger.
    /// ISSUED is the only non-terminal state.
    enum class voucher_status : uint8_t {
        /// Active and redeemable.
        issued,
        /// Redeemed once; any further redemption is a double-spend.
        redeemed,
        /// Withdrawn by the issuer.
        revoked,
        /// Past its validity period.
        expired,
        /// Anything a ledger reports outside the known set. Always treated
        /// as invalid.
        unknown
    };

    /// Returns the upper-case name of a status, e.g. "ISSUED".
    auto to_string(voucher_status status) -> std::string;

    /// Parses an upper-case status name.
    /// \param name status name, e.g. "REDEEMED".
    /// \return the matching status, or voucher_status::unknown if the name
    ///         is not recognised.
    auto parse_status(const std::string& name) -> voucher_status;

    /// Indicates whether no transition can leave the given status.
    /// \return true for REDEEMED, REVOKED and EXPIRED.
    auto is_terminal(voucher_status status) -> bool;

    /// Indicates whether a voucher in the given status may be redeemed.
    /// \return true only for ISSUED.
    auto can_be_redeemed(voucher_status status) -> bool;

    /// Returns a human-readable description of the status.
    auto description(voucher_status status) -> std::string;

    /// Encodes the ledger transition table: only ISSUED may advance, and
    /// only to REDEEMED, REVOKED or EXPIRED. Ledger implementations use this
    /// to reject updates that would leave a terminal state.
    /// \param from current status.
    /// \param to requested status.
    /// \return true if the transition is permitted.
    auto is_allowed_transition(voucher_status from, voucher_status to)
        -> bool;
}

#endif // EVOUCHER_SRC_VOUCHER_STATUS_H_
