// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef EVOUCHER_SRC_BACKUP_BACKUP_SERVICE_H_
#define EVOUCHER_SRC_BACKUP_BACKUP_SERVICE_H_

#include "interface.hpp"
#include "stored_voucher.hpp"
#include "util/common/logging.hpp"

#include <memory>

namespace evoucher::backup {
    /// Error reported when a backup operation is given a blank user key.
    static constexpr auto blank_user_key_error
        = "User private key cannot be blank";

    /// \brief Schedules wallet backups and merges restored vouchers back
    ///        into the wallet.
    ///
    /// Backup timestamps are only stamped after the backup store confirms
    /// the write, so a failed attempt leaves the same vouchers pending for
    /// the next one.
    class backup_service {
      public:
        /// Constructor.
        /// \param store backup store to write to and restore from.
        /// \param logger log instance; nullptr disables logging.
        backup_service(std::shared_ptr<interface> store,
                       std::shared_ptr<logging::log> logger);

        /// Backs up the vouchers that were never backed up or changed since
        /// their last backup, then stamps them as backed up.
        /// \param vouchers wallet contents; backed-up entries are stamped in
        ///                 place.
        /// \param user_key user secret the backup is bound to.
        /// \return number of vouchers backed up, or the failure.
        auto backup_if_needed(std::vector<stored_voucher>& vouchers,
                              const std::string& user_key)
            -> std::variant<size_t, precondition_error, operational_error>;

        /// Backs up every voucher and stamps all of them as backed up.
        /// \param vouchers wallet contents, stamped in place on success.
        /// \param user_key user secret the backup is bound to.
        /// \return std::nullopt on success, or the failure.
        auto backup_all(std::vector<stored_voucher>& vouchers,
                        const std::string& user_key)
            -> std::optional<service_error>;

        /// \brief Restores backed-up vouchers and merges them into the
        ///        local wallet.
        ///
        /// Local entries always win when both sides hold the same voucher
        /// ID. The result keeps the local entries in their original order,
        /// followed by the restored entries missing locally, in restore
        /// order.
        /// \param local current wallet contents.
        /// \param user_key user secret the backup is bound to.
        /// \return merged wallet contents, or the failure.
        auto restore_and_merge(const std::vector<stored_voucher>& local,
                               const std::string& user_key)
            -> std::variant<std::vector<stored_voucher>,
                            precondition_error,
                            operational_error>;

        /// Restores backed-up vouchers without merging. Every entry is
        /// marked as backed up.
        auto restore(const std::string& user_key)
            -> std::variant<std::vector<stored_voucher>,
                            precondition_error,
                            operational_error>;

        /// Checks that every expected voucher can be restored. A restore
        /// failure is logged and reported as false.
        /// \param expected_ids vouchers that must be present.
        /// \param user_key user secret the backup is bound to.
        /// \return true if all expected vouchers are present, or a
        ///         precondition error for a blank key.
        auto verify_backup(const std::vector<voucher_id_t>& expected_ids,
                           const std::string& user_key)
            -> std::variant<bool, precondition_error>;

      private:
        std::shared_ptr<interface> m_store;
        std::shared_ptr<logging::log> m_log;

        auto store_vouchers(const std::vector<signed_voucher>& vouchers,
                            const std::string& user_key)
            -> std::optional<operational_error>;

        auto fetch(const std::string& user_key)
            -> std::variant<std::vector<stored_voucher>, operational_error>;
    };
}

#endif // EVOUCHER_SRC_BACKUP_BACKUP_SERVICE_H_
