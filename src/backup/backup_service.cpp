// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "backup_service.hpp"

#include "util/common/clock.hpp"
#include "util/common/strings.hpp"

#include <set>

namespace evoucher::backup {
    backup_service::backup_service(std::shared_ptr<interface> store,
                                   std::shared_ptr<logging::log> logger)
        : m_store(std::move(store)),
          m_log(logging::or_silent(std::move(logger))) {}

    auto backup_service::backup_if_needed(std::vector<stored_voucher>& vouchers,
                                          const std::string& user_key)
        -> std::variant<size_t, precondition_error, operational_error> {
        if(is_blank(user_key)) {
            return precondition_error{blank_user_key_error};
        }

        m_log->debug("Checking", vouchers.size(), "voucher(s) for backup");

        auto pending = std::vector<stored_voucher*>();
        auto to_backup = std::vector<signed_voucher>();
        for(auto& v : vouchers) {
            if(v.needs_backup()) {
                pending.push_back(&v);
                to_backup.push_back(v.m_voucher);
            }
        }

        if(pending.empty()) {
            m_log->debug("No vouchers need backup");
            return size_t{0};
        }

        m_log->info("Backing up",
                    pending.size(),
                    "of",
                    vouchers.size(),
                    "voucher(s)");

        auto err = store_vouchers(to_backup, user_key);
        if(err.has_value()) {
            return std::move(err.value());
        }

        const auto backup_time = unix_time_now();
        for(auto* v : pending) {
            v->mark_backed_up(backup_time);
        }

        m_log->info("Successfully backed up", pending.size(), "voucher(s)");
        return pending.size();
    }

    auto backup_service::backup_all(std::vector<stored_voucher>& vouchers,
                                    const std::string& user_key)
        -> std::optional<service_error> {
        if(is_blank(user_key)) {
            return precondition_error{blank_user_key_error};
        }

        m_log->info("Backing up all", vouchers.size(), "voucher(s)");

        auto to_backup = std::vector<signed_voucher>();
        to_backup.reserve(vouchers.size());
        for(const auto& v : vouchers) {
            to_backup.push_back(v.m_voucher);
        }

        auto err = store_vouchers(to_backup, user_key);
        if(err.has_value()) {
            return std::move(err.value());
        }

        const auto backup_time = unix_time_now();
        for(auto& v : vouchers) {
            v.mark_backed_up(backup_time);
        }

        m_log->info("Successfully backed up all",
                    vouchers.size(),
                    "voucher(s)");
        return std::nullopt;
    }

    auto backup_service::restore_and_merge(
        const std::vector<stored_voucher>& local,
        const std::string& user_key)
        -> std::variant<std::vector<stored_voucher>,
                        precondition_error,
                        operational_error> {
        if(is_blank(user_key)) {
            return precondition_error{blank_user_key_error};
        }

        m_log->info("Restoring vouchers and merging with",
                    local.size(),
                    "local voucher(s)");

        auto res = fetch(user_key);
        if(std::holds_alternative<operational_error>(res)) {
            return std::get<operational_error>(std::move(res));
        }
        auto& restored = std::get<std::vector<stored_voucher>>(res);
        m_log->info("Restored", restored.size(), "voucher(s) from backup");

        auto merged = local;
        auto seen = std::set<voucher_id_t>();
        for(const auto& v : local) {
            seen.insert(v.voucher_id());
        }

        size_t added{0};
        for(auto& v : restored) {
            const auto id_str = format_voucher_id(v.voucher_id());
            if(!seen.insert(v.voucher_id()).second) {
                m_log->debug("Voucher already exists locally, keeping local "
                             "version:",
                             id_str);
                continue;
            }
            m_log->debug("Added restored voucher:", id_str);
            merged.push_back(std::move(v));
            added++;
        }

        m_log->debug("Merge added", added, "new voucher(s) from backup");
        m_log->info("Merge complete:", merged.size(), "total voucher(s)");
        return merged;
    }

    auto backup_service::restore(const std::string& user_key)
        -> std::variant<std::vector<stored_voucher>,
                        precondition_error,
                        operational_error> {
        if(is_blank(user_key)) {
            return precondition_error{blank_user_key_error};
        }

        m_log->info("Restoring vouchers from backup");

        auto res = fetch(user_key);
        if(std::holds_alternative<operational_error>(res)) {
            return std::get<operational_error>(std::move(res));
        }
        auto& restored = std::get<std::vector<stored_voucher>>(res);
        m_log->info("Restored", restored.size(), "voucher(s)");
        return std::move(restored);
    }

    auto backup_service::verify_backup(
        const std::vector<voucher_id_t>& expected_ids,
        const std::string& user_key) -> std::variant<bool, precondition_error> {
        if(is_blank(user_key)) {
            return precondition_error{blank_user_key_error};
        }

        m_log->info("Verifying backup integrity:",
                    expected_ids.size(),
                    "expected voucher(s)");

        auto res = m_store->restore(user_key);
        if(std::holds_alternative<port_error>(res)) {
            m_log->error("Backup verification failed:",
                         std::get<port_error>(res).m_message);
            return false;
        }

        auto restored_ids = std::set<voucher_id_t>();
        for(const auto& v : std::get<std::vector<signed_voucher>>(res)) {
            restored_ids.insert(v.voucher_id());
        }

        auto all_present = true;
        for(const auto& id : expected_ids) {
            if(restored_ids.find(id) == restored_ids.end()) {
                m_log->warn("Backup verification failed: missing voucher",
                            format_voucher_id(id));
                all_present = false;
            }
        }

        if(all_present) {
            m_log->info("Backup verification successful: all",
                        expected_ids.size(),
                        "voucher(s) present");
        } else {
            m_log->warn("Backup verification failed: some vouchers missing");
        }
        return all_present;
    }

    auto backup_service::store_vouchers(
        const std::vector<signed_voucher>& vouchers,
        const std::string& user_key) -> std::optional<operational_error> {
        auto err = m_store->backup(vouchers, user_key);
        if(err.has_value()) {
            m_log->error("Failed to back up",
                         vouchers.size(),
                         "voucher(s):",
                         err->m_message);
            return operational_error{"Failed to back up vouchers: "
                                     + err->m_message};
        }
        return std::nullopt;
    }

    auto backup_service::fetch(const std::string& user_key)
        -> std::variant<std::vector<stored_voucher>, operational_error> {
        auto res = m_store->restore(user_key);
        if(std::holds_alternative<port_error>(res)) {
            const auto& msg = std::get<port_error>(res).m_message;
            m_log->error("Failed to restore vouchers:", msg);
            return operational_error{"Failed to restore vouchers: " + msg};
        }

        const auto restore_time = unix_time_now();
        auto ret = std::vector<stored_voucher>();
        for(auto& v : std::get<std::vector<signed_voucher>>(res)) {
            auto stored = stored_voucher(std::move(v), restore_time);
            stored.mark_backed_up(restore_time);
            ret.push_back(std::move(stored));
        }
        return ret;
    }
}
