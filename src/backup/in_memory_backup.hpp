// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef EVOUCHER_SRC_BACKUP_IN_MEMORY_BACKUP_H_
#define EVOUCHER_SRC_BACKUP_IN_MEMORY_BACKUP_H_

#include "interface.hpp"
#include "util/common/buffer.hpp"
#include "util/common/logging.hpp"

#include <map>
#include <memory>
#include <mutex>

namespace evoucher::backup {
    /// \brief Backup store held in process memory.
    ///
    /// Each backup call is kept as a separate serialized snapshot under the
    /// user key. Restoring replays the snapshots in the order they were
    /// taken; a later copy of a voucher replaces an earlier one in place.
    class in_memory_backup final : public interface {
      public:
        /// Constructor.
        /// \param logger log instance; nullptr disables logging.
        explicit in_memory_backup(std::shared_ptr<logging::log> logger
                                  = nullptr);

        [[nodiscard]] auto backup(const std::vector<signed_voucher>& vouchers,
                                  const std::string& user_key)
            -> std::optional<port_error> override;

        [[nodiscard]] auto restore(const std::string& user_key)
            -> restore_result override;

        [[nodiscard]] auto delete_backups(const std::string& user_key)
            -> std::optional<port_error> override;

        /// Returns the number of snapshots stored under the given key.
        [[nodiscard]] auto snapshot_count(const std::string& user_key) const
            -> size_t;

      private:
        std::shared_ptr<logging::log> m_log;
        mutable std::mutex m_mut;
        std::map<std::string, std::vector<buffer>> m_snapshots;
    };
}

#endif // EVOUCHER_SRC_BACKUP_IN_MEMORY_BACKUP_H_
