// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "in_memory_backup.hpp"

#include "util/serialization/buffer_serializer.hpp"
#include "util/serialization/format.hpp"
#include "util/serialization/util.hpp"
#include "voucher/messages.hpp"

namespace evoucher::backup {
    in_memory_backup::in_memory_backup(std::shared_ptr<logging::log> logger)
        : m_log(logging::or_silent(std::move(logger))) {}

    auto in_memory_backup::backup(const std::vector<signed_voucher>& vouchers,
                                  const std::string& user_key)
        -> std::optional<port_error> {
        auto snapshot = make_buffer(vouchers);
        std::unique_lock<std::mutex> l(m_mut);
        m_snapshots[user_key].emplace_back(std::move(snapshot));
        l.unlock();

        m_log->debug("Stored backup snapshot of",
                     vouchers.size(),
                     "voucher(s)");
        return std::nullopt;
    }

    auto in_memory_backup::restore(const std::string& user_key)
        -> restore_result {
        std::vector<buffer> snapshots;
        {
            std::unique_lock<std::mutex> l(m_mut);
            const auto it = m_snapshots.find(user_key);
            if(it != m_snapshots.end()) {
                snapshots = it->second;
            }
        }

        auto restored = std::vector<signed_voucher>();
        auto index = std::map<voucher_id_t, size_t>();
        for(auto& snapshot : snapshots) {
            auto deser = buffer_serializer(snapshot);
            auto vouchers = deserialize_signed_vouchers(deser);
            if(!vouchers.has_value()) {
                return port_error{"Backup snapshot is corrupt"};
            }
            for(auto& voucher : vouchers.value()) {
                const auto it = index.find(voucher.voucher_id());
                if(it != index.end()) {
                    restored[it->second] = std::move(voucher);
                    continue;
                }
                index.emplace(voucher.voucher_id(), restored.size());
                restored.emplace_back(std::move(voucher));
            }
        }

        m_log->debug("Restored",
                     restored.size(),
                     "voucher(s) from",
                     snapshots.size(),
                     "snapshot(s)");
        return restored;
    }

    auto in_memory_backup::delete_backups(const std::string& user_key)
        -> std::optional<port_error> {
        std::unique_lock<std::mutex> l(m_mut);
        m_snapshots.erase(user_key);
        return std::nullopt;
    }

    auto in_memory_backup::snapshot_count(const std::string& user_key) const
        -> size_t {
        std::unique_lock<std::mutex> l(m_mut);
        const auto it = m_snapshots.find(user_key);
        if(it == m_snapshots.end()) {
            return 0;
        }
        return it->second.size();
    }
}
