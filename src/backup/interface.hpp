// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef EVOUCHER_SRC_BACKUP_INTERFACE_H_
#define EVOUCHER_SRC_BACKUP_INTERFACE_H_

#include "voucher/error.hpp"
#include "voucher/signed_voucher.hpp"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace evoucher::backup {
    /// Result of a restore: every backed-up voucher, or the Port failure.
    using restore_result = std::variant<std::vector<signed_voucher>, port_error>;

    /// \brief Storage for encrypted copies of a user's vouchers, keyed by a
    ///        user secret.
    ///
    /// Implementations decide how vouchers are encrypted and transported;
    /// callers only see success or failure.
    class interface {
      public:
        interface() = default;
        virtual ~interface() = default;
        interface(const interface&) = default;
        auto operator=(const interface&) -> interface& = default;
        interface(interface&&) = default;
        auto operator=(interface&&) -> interface& = default;

        /// Stores copies of the given vouchers.
        /// \param vouchers vouchers to store.
        /// \param user_key user secret the backup is bound to.
        /// \return std::nullopt on success, or the failure.
        [[nodiscard]] virtual auto backup(
            const std::vector<signed_voucher>& vouchers,
            const std::string& user_key) -> std::optional<port_error> = 0;

        /// Fetches every voucher backed up under the given key. A voucher
        /// backed up more than once is returned once, in its latest form.
        /// \param user_key user secret the backup is bound to.
        /// \return the vouchers, or the failure.
        [[nodiscard]] virtual auto restore(const std::string& user_key)
            -> restore_result = 0;

        /// Checks whether anything is backed up under the given key. The
        /// default implementation restores and checks for a non-empty
        /// result.
        [[nodiscard]] virtual auto has_backups(const std::string& user_key)
            -> std::variant<bool, port_error>;

        /// Removes every backup under the given key. The default
        /// implementation reports the operation as not supported.
        [[nodiscard]] virtual auto delete_backups(const std::string& user_key)
            -> std::optional<port_error>;
    };
}

#endif // EVOUCHER_SRC_BACKUP_INTERFACE_H_
