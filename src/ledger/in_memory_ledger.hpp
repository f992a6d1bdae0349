// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef EVOUCHER_SRC_LEDGER_IN_MEMORY_LEDGER_H_
#define EVOUCHER_SRC_LEDGER_IN_MEMORY_LEDGER_H_

#include "interface.hpp"
#include "util/common/logging.hpp"

#include <map>
#include <memory>
#include <mutex>

namespace evoucher::ledger {
    /// \brief Ledger held in process memory.
    ///
    /// Every operation runs under a single writer lock. Status updates are
    /// conditional replaces: they succeed only when
    /// \ref is_allowed_transition permits the move from the recorded status,
    /// so a voucher reaches REDEEMED at most once. Publishing an ID that is
    /// already recorded is rejected.
    class in_memory_ledger final : public interface {
      public:
        /// Constructor.
        /// \param logger log instance; nullptr disables logging.
        explicit in_memory_ledger(std::shared_ptr<logging::log> logger
                                  = nullptr);

        [[nodiscard]] auto publish(const signed_voucher& voucher,
                                   voucher_status status)
            -> std::optional<port_error> override;

        [[nodiscard]] auto query_status(const voucher_id_t& voucher_id)
            -> status_result override;

        [[nodiscard]] auto update_status(const voucher_id_t& voucher_id,
                                         voucher_status status)
            -> std::optional<port_error> override;

        [[nodiscard]] auto query_voucher(const voucher_id_t& voucher_id)
            -> voucher_result override;

        /// Returns the number of recorded vouchers.
        [[nodiscard]] auto size() const -> size_t;

      private:
        struct entry {
            signed_voucher m_voucher;
            voucher_status m_status;
        };

        std::shared_ptr<logging::log> m_log;
        mutable std::mutex m_mut;
        std::map<voucher_id_t, entry> m_entries;
    };
}

#endif // EVOUCHER_SRC_LEDGER_IN_MEMORY_LEDGER_H_
