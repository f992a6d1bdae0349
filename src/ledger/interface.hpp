// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef EVOUCHER_SRC_LEDGER_INTERFACE_H_
#define EVOUCHER_SRC_LEDGER_INTERFACE_H_

#include "voucher/error.hpp"
#include "voucher/signed_voucher.hpp"
#include "voucher/status.hpp"
#include "voucher/voucher_id.hpp"

#include <optional>
#include <variant>

namespace evoucher::ledger {
    /// Result of a status query: the recorded status, std::nullopt if the
    /// ledger has no record of the voucher, or the Port failure.
    using status_result = std::variant<std::optional<voucher_status>, port_error>;

    /// Result of a voucher lookup.
    using voucher_result
        = std::variant<std::optional<signed_voucher>, port_error>;

    /// \brief Public, append-only source of truth for voucher status.
    ///
    /// Implementations must make update_status linearizable per voucher ID
    /// and must accept at most one transition to REDEEMED for any voucher,
    /// for example with an atomic conditional replace that only succeeds
    /// while the current status is ISSUED. Calls block until the ledger has
    /// acknowledged or rejected the operation.
    class interface {
      public:
        interface() = default;
        virtual ~interface() = default;
        interface(const interface&) = default;
        auto operator=(const interface&) -> interface& = default;
        interface(interface&&) = default;
        auto operator=(interface&&) -> interface& = default;

        /// Records a newly issued voucher with its initial status.
        /// \param voucher voucher to publish.
        /// \param status initial status, normally ISSUED.
        /// \return std::nullopt on success, or the failure.
        [[nodiscard]] virtual auto publish(const signed_voucher& voucher,
                                           voucher_status status)
            -> std::optional<port_error> = 0;

        /// Looks up the current status of a voucher.
        /// \param voucher_id voucher to look up.
        /// \return the status, std::nullopt if unknown to the ledger, or the
        ///         failure.
        [[nodiscard]] virtual auto query_status(const voucher_id_t& voucher_id)
            -> status_result = 0;

        /// Advances the status of a voucher.
        /// \param voucher_id voucher to update.
        /// \param status new status.
        /// \return std::nullopt on success, or the failure, including a
        ///         rejected transition.
        [[nodiscard]] virtual auto update_status(const voucher_id_t& voucher_id,
                                                 voucher_status status)
            -> std::optional<port_error> = 0;

        /// Checks whether the ledger has any record of a voucher. The default
        /// implementation checks whether \ref query_status finds a status.
        /// \param voucher_id voucher to look up.
        /// \return true if a status is recorded, or the failure.
        [[nodiscard]] virtual auto exists(const voucher_id_t& voucher_id)
            -> std::variant<bool, port_error>;

        /// Fetches the full voucher recorded in the ledger. Not every ledger
        /// stores vouchers; the default implementation reports the operation
        /// as not supported.
        /// \param voucher_id voucher to fetch.
        /// \return the voucher, std::nullopt if unknown, or the failure.
        [[nodiscard]] virtual auto query_voucher(const voucher_id_t& voucher_id)
            -> voucher_result;
    };
}

#endif // EVOUCHER_SRC_LEDGER_INTERFACE_H_
