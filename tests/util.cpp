// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "util.hpp"

#include "util/common/random_source.hpp"

namespace evoucher::test {
    auto privkey(const std::string& hex) -> privkey_t {
        auto key = array_from_hex<privkey_len>(hex);
        EXPECT_TRUE(key.has_value());
        return key.value_or(privkey_t{});
    }

    auto quiet_log() -> std::shared_ptr<logging::log> {
        return std::make_shared<logging::log>(logging::log_level::trace,
                                              false);
    }

    auto make_engine() -> std::shared_ptr<signature_engine> {
        return std::make_shared<signature_engine>(
            std::make_shared<random_source>());
    }

    auto sample_terms(const std::string& id) -> voucher_terms {
        auto terms = voucher_terms();
        terms.m_voucher_id = voucher_id(id);
        terms.m_issuer_id = "merchant-a";
        terms.m_unit = "sat";
        terms.m_face_value = 1000;
        return terms;
    }

    auto make_secret(const voucher_terms& terms) -> voucher_secret {
        auto res = voucher_secret::create(terms);
        if(const auto* err = std::get_if<precondition_error>(&res)) {
            ADD_FAILURE() << err->m_message;
        }
        return std::get<voucher_secret>(std::move(res));
    }

    auto make_signed(const signature_engine& engine,
                     const voucher_terms& terms) -> signed_voucher {
        auto res = engine.create_signed(make_secret(terms),
                                        privkey(issuer_privkey_hex));
        if(const auto* err = std::get_if<precondition_error>(&res)) {
            ADD_FAILURE() << err->m_message;
        }
        return std::get<signed_voucher>(std::move(res));
    }

    auto voucher_id(const std::string& str) -> voucher_id_t {
        auto id = parse_voucher_id(str);
        EXPECT_TRUE(id.has_value());
        return id.value_or(voucher_id_t{});
    }

    auto counting_ledger::publish(const signed_voucher& voucher,
                                  voucher_status status)
        -> std::optional<port_error> {
        m_publish_calls++;
        if(m_fail_publish) {
            return port_error{"relay unreachable"};
        }
        m_statuses[voucher.voucher_id()] = status;
        return std::nullopt;
    }

    auto counting_ledger::query_status(const voucher_id_t& voucher_id)
        -> ledger::status_result {
        m_query_calls++;
        if(m_fail_query) {
            return port_error{"query timed out"};
        }
        const auto it = m_statuses.find(voucher_id);
        if(it == m_statuses.end()) {
            return std::optional<voucher_status>();
        }
        return std::optional<voucher_status>(it->second);
    }

    auto counting_ledger::update_status(const voucher_id_t& voucher_id,
                                        voucher_status status)
        -> std::optional<port_error> {
        m_update_calls++;
        if(m_fail_update) {
            return port_error{"write rejected"};
        }
        m_statuses[voucher_id] = status;
        return std::nullopt;
    }

    auto counting_ledger::calls() const -> size_t {
        return m_publish_calls + m_query_calls + m_update_calls;
    }

    auto counting_backup::backup(const std::vector<signed_voucher>& vouchers,
                                 const std::string& user_key)
        -> std::optional<port_error> {
        m_backup_calls++;
        m_last_backup_size = vouchers.size();
        if(m_fail_backup) {
            return port_error{"relay unreachable"};
        }
        auto& stored = m_stored[user_key];
        stored.insert(stored.end(), vouchers.begin(), vouchers.end());
        return std::nullopt;
    }

    auto counting_backup::restore(const std::string& user_key)
        -> backup::restore_result {
        m_restore_calls++;
        if(m_fail_restore) {
            return port_error{"relay unreachable"};
        }
        const auto it = m_stored.find(user_key);
        if(it == m_stored.end()) {
            return std::vector<signed_voucher>();
        }
        return it->second;
    }
}
