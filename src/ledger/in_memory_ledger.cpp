// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "in_memory_ledger.hpp"

namespace evoucher::ledger {
    in_memory_ledger::in_memory_ledger(std::shared_ptr<logging::log> logger)
        : m_log(logging::or_silent(std::move(logger))) {}

    auto in_memory_ledger::publish(const signed_voucher& voucher,
                                   voucher_status status)
        -> std::optional<port_error> {
        const auto id_str = format_voucher_id(voucher.voucher_id());
        std::unique_lock<std::mutex> l(m_mut);
        const auto [it, inserted]
            = m_entries.try_emplace(voucher.voucher_id(),
                                    entry{voucher, status});
        if(!inserted) {
            return port_error{"Voucher " + id_str + " is already published"};
        }
        l.unlock();

        m_log->debug("Published voucher", id_str, "as", to_string(status));
        return std::nullopt;
    }

    auto in_memory_ledger::query_status(const voucher_id_t& voucher_id)
        -> status_result {
        std::unique_lock<std::mutex> l(m_mut);
        const auto it = m_entries.find(voucher_id);
        if(it == m_entries.end()) {
            return std::optional<voucher_status>();
        }
        return std::optional<voucher_status>(it->second.m_status);
    }

    auto in_memory_ledger::update_status(const voucher_id_t& voucher_id,
                                         voucher_status status)
        -> std::optional<port_error> {
        const auto id_str = format_voucher_id(voucher_id);
        std::unique_lock<std::mutex> l(m_mut);
        const auto it = m_entries.find(voucher_id);
        if(it == m_entries.end()) {
            return port_error{"Voucher " + id_str + " not found in ledger"};
        }
        const auto current = it->second.m_status;
        if(!is_allowed_transition(current, status)) {
            return port_error{"Transition from " + to_string(current) + " to "
                              + to_string(status)
                              + " is not allowed for voucher " + id_str};
        }
        it->second.m_status = status;
        l.unlock();

        m_log->debug("Voucher",
                     id_str,
                     "moved from",
                     to_string(current),
                     "to",
                     to_string(status));
        return std::nullopt;
    }

    auto in_memory_ledger::query_voucher(const voucher_id_t& voucher_id)
        -> voucher_result {
        std::unique_lock<std::mutex> l(m_mut);
        const auto it = m_entries.find(voucher_id);
        if(it == m_entries.end()) {
            return std::optional<signed_voucher>();
        }
        return std::optional<signed_voucher>(it->second.m_voucher);
    }

    auto in_memory_ledger::size() const -> size_t {
        std::unique_lock<std::mutex> l(m_mut);
        return m_entries.size();
    }
}
