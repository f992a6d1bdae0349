// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef EVOUCHER_SRC_BACKUP_STORED_VOUCHER_H_
#define EVOUCHER_SRC_BACKUP_STORED_VOUCHER_H_

#include "voucher/signed_voucher.hpp"
#include "voucher/status.hpp"

#include <optional>
#include <string>

namespace evoucher::backup {
    /// \brief A voucher held in a user's wallet, with backup and status
    ///        bookkeeping.
    ///
    /// All timestamps are Unix seconds.
    struct stored_voucher {
        /// Constructor. Stamps the time the voucher was added.
        /// \param voucher the voucher.
        /// \param added_at time the voucher was added to the wallet.
        /// \param label optional user-facing label.
        stored_voucher(signed_voucher voucher,
                       int64_t added_at,
                       std::optional<std::string> label = std::nullopt);

        /// Constructor. Stamps the current time as the time added.
        explicit stored_voucher(signed_voucher voucher,
                                std::optional<std::string> label
                                = std::nullopt);

        /// The voucher.
        signed_voucher m_voucher;
        /// Time the voucher was added or last modified locally.
        int64_t m_added_at;
        /// Time of the last successful backup.
        std::optional<int64_t> m_last_backup_at;
        /// Last status fetched from the ledger.
        std::optional<voucher_status> m_cached_status;
        /// Time the cached status was fetched.
        std::optional<int64_t> m_status_updated_at;
        /// User-facing label.
        std::optional<std::string> m_user_label;

        /// Records a successful backup at the given time.
        void mark_backed_up(int64_t now);
        void mark_backed_up();

        /// Caches a ledger status fetched at the given time.
        void update_status(voucher_status status, int64_t now);
        void update_status(voucher_status status);

        /// Indicates whether the voucher was never backed up or was
        /// modified since its last backup.
        [[nodiscard]] auto needs_backup() const -> bool;

        /// Indicates whether the cached status was never fetched or is
        /// older than the threshold.
        /// \param threshold_seconds maximum acceptable age.
        /// \param now current time.
        [[nodiscard]] auto is_status_stale(int64_t threshold_seconds,
                                           int64_t now) const -> bool;
        [[nodiscard]] auto is_status_stale(int64_t threshold_seconds) const
            -> bool;

        [[nodiscard]] auto voucher_id() const -> const voucher_id_t&;
        [[nodiscard]] auto amount() const -> int64_t;
        [[nodiscard]] auto unit() const -> const std::string&;
        [[nodiscard]] auto expires_at() const -> const std::optional<int64_t>&;
        [[nodiscard]] auto is_expired() const -> bool;

        auto operator==(const stored_voucher& rhs) const -> bool;
    };
}

#endif // EVOUCHER_SRC_BACKUP_STORED_VOUCHER_H_
