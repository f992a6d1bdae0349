// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef EVOUCHER_SRC_VOUCHER_ERROR_H_
#define EVOUCHER_SRC_VOUCHER_ERROR_H_

#include <string>
#include <variant>

namespace evoucher {
    /// A required argument was missing, blank, out of range or malformed.
    /// Reported before any cryptography or Port call takes place.
    struct precondition_error {
        /// Description of the violated precondition.
        std::string m_message;

        auto operator==(const precondition_error& rhs) const -> bool;
    };

    /// A Port call failed where the failure leaves state inconsistent or
    /// the operation cannot complete, such as issuance publish or marking a
    /// verified voucher as redeemed.
    struct operational_error {
        /// Description of the failure, including the Port's message.
        std::string m_message;

        auto operator==(const operational_error& rhs) const -> bool;
    };

    /// Failure reported by a Ledger or Backup Port implementation.
    struct port_error {
        /// Transport-specific failure message.
        std::string m_message;

        auto operator==(const port_error& rhs) const -> bool;
    };

    /// Failure of a service operation that checks its arguments and then
    /// calls a Port.
    using service_error = std::variant<precondition_error, operational_error>;

    /// Returns the message carried by a service error.
    auto error_message(const service_error& err) -> const std::string&;
}

#endif // EVOUCHER_SRC_VOUCHER_ERROR_H_
