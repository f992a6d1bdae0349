// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "../util.hpp"
#include "backup/backup_service.hpp"
#include "backup/in_memory_backup.hpp"
#include "backup/stored_voucher.hpp"

#include <gtest/gtest.h>

class backup_test : public ::testing::Test {
  protected:
    void SetUp() override {
        m_a = evoucher::test::make_signed(
            *m_engine,
            evoucher::test::sample_terms(m_id_a));
        m_b = evoucher::test::make_signed(
            *m_engine,
            evoucher::test::sample_terms(m_id_b));
        m_c = evoucher::test::make_signed(
            *m_engine,
            evoucher::test::sample_terms(m_id_c));
    }

    static auto ids(const std::vector<evoucher::backup::stored_voucher>& vs)
        -> std::vector<evoucher::voucher_id_t> {
        auto ret = std::vector<evoucher::voucher_id_t>();
        for(const auto& v : vs) {
            ret.push_back(v.voucher_id());
        }
        return ret;
    }

    static constexpr auto m_id_a = "00000000-0000-4000-8000-00000000000a";
    static constexpr auto m_id_b = "00000000-0000-4000-8000-00000000000b";
    static constexpr auto m_id_c = "00000000-0000-4000-8000-00000000000c";
    static constexpr auto m_key = "user-secret";
    static constexpr int64_t m_added{1000};

    std::shared_ptr<evoucher::signature_engine> m_engine{
        evoucher::test::make_engine()};
    std::shared_ptr<evoucher::test::counting_backup> m_store{
        std::make_shared<evoucher::test::counting_backup>()};
    evoucher::backup::backup_service m_service{m_store,
                                               evoucher::test::quiet_log()};
    std::optional<evoucher::signed_voucher> m_a;
    std::optional<evoucher::signed_voucher> m_b;
    std::optional<evoucher::signed_voucher> m_c;
};

TEST_F(backup_test, stored_voucher_backup_state) {
    auto v = evoucher::backup::stored_voucher(*m_a, m_added, "coffee");
    ASSERT_TRUE(v.needs_backup());
    ASSERT_EQ(v.m_user_label, "coffee");
    ASSERT_EQ(v.amount(), 1000);
    ASSERT_EQ(v.unit(), "sat");
    ASSERT_FALSE(v.is_expired());

    v.mark_backed_up(m_added);
    ASSERT_FALSE(v.needs_backup());

    // Modified locally after the last backup.
    v.m_added_at = m_added + 1;
    ASSERT_TRUE(v.needs_backup());
    v.mark_backed_up(m_added + 1);
    ASSERT_FALSE(v.needs_backup());
}

TEST_F(backup_test, stored_voucher_status_staleness) {
    auto v = evoucher::backup::stored_voucher(*m_a, m_added);
    ASSERT_TRUE(v.is_status_stale(300, m_added));

    v.update_status(evoucher::voucher_status::issued, m_added);
    ASSERT_EQ(v.m_cached_status, evoucher::voucher_status::issued);
    ASSERT_FALSE(v.is_status_stale(300, m_added + 300));
    ASSERT_TRUE(v.is_status_stale(300, m_added + 301));
}

TEST_F(backup_test, backup_if_needed_only_once) {
    auto wallet = std::vector<evoucher::backup::stored_voucher>{
        evoucher::backup::stored_voucher(*m_a, m_added),
        evoucher::backup::stored_voucher(*m_b, m_added)};

    auto res = m_service.backup_if_needed(wallet, m_key);
    ASSERT_EQ(std::get<size_t>(res), 2UL);
    ASSERT_EQ(m_store->m_backup_calls, 1UL);
    ASSERT_EQ(m_store->m_last_backup_size, 2UL);
    for(const auto& v : wallet) {
        ASSERT_TRUE(v.m_last_backup_at.has_value());
        ASSERT_FALSE(v.needs_backup());
    }

    res = m_service.backup_if_needed(wallet, m_key);
    ASSERT_EQ(std::get<size_t>(res), 0UL);
    ASSERT_EQ(m_store->m_backup_calls, 1UL);
}

TEST_F(backup_test, backup_if_needed_sends_pending_only) {
    auto wallet = std::vector<evoucher::backup::stored_voucher>{
        evoucher::backup::stored_voucher(*m_a, m_added),
        evoucher::backup::stored_voucher(*m_b, m_added)};
    wallet[0].mark_backed_up(m_added);

    auto res = m_service.backup_if_needed(wallet, m_key);
    ASSERT_EQ(std::get<size_t>(res), 1UL);
    ASSERT_EQ(m_store->m_last_backup_size, 1UL);
    ASSERT_EQ(m_store->m_stored[m_key].front(), *m_b);
    ASSERT_EQ(wallet[0].m_last_backup_at, m_added);
}

TEST_F(backup_test, failed_backup_stamps_nothing) {
    auto wallet = std::vector<evoucher::backup::stored_voucher>{
        evoucher::backup::stored_voucher(*m_a, m_added)};
    m_store->m_fail_backup = true;

    auto res = m_service.backup_if_needed(wallet, m_key);
    ASSERT_TRUE(std::holds_alternative<evoucher::operational_error>(res));
    ASSERT_EQ(std::get<evoucher::operational_error>(res).m_message,
              "Failed to back up vouchers: relay unreachable");
    ASSERT_FALSE(wallet[0].m_last_backup_at.has_value());
    ASSERT_TRUE(wallet[0].needs_backup());

    m_store->m_fail_backup = false;
    res = m_service.backup_if_needed(wallet, m_key);
    ASSERT_EQ(std::get<size_t>(res), 1UL);
}

TEST_F(backup_test, blank_user_key) {
    auto wallet = std::vector<evoucher::backup::stored_voucher>{
        evoucher::backup::stored_voucher(*m_a, m_added)};

    auto res = m_service.backup_if_needed(wallet, "  ");
    ASSERT_EQ(std::get<evoucher::precondition_error>(res).m_message,
              evoucher::backup::blank_user_key_error);

    auto err = m_service.backup_all(wallet, "");
    ASSERT_TRUE(err.has_value());
    ASSERT_EQ(evoucher::error_message(err.value()),
              evoucher::backup::blank_user_key_error);

    auto restored = m_service.restore("");
    ASSERT_TRUE(std::holds_alternative<evoucher::precondition_error>(restored));
    auto merged = m_service.restore_and_merge(wallet, "\t");
    ASSERT_TRUE(std::holds_alternative<evoucher::precondition_error>(merged));
    auto verified = m_service.verify_backup({}, "");
    ASSERT_TRUE(std::holds_alternative<evoucher::precondition_error>(verified));

    ASSERT_EQ(m_store->m_backup_calls, 0UL);
    ASSERT_EQ(m_store->m_restore_calls, 0UL);
}

TEST_F(backup_test, backup_all_sends_everything) {
    auto wallet = std::vector<evoucher::backup::stored_voucher>{
        evoucher::backup::stored_voucher(*m_a, m_added),
        evoucher::backup::stored_voucher(*m_b, m_added)};
    wallet[0].mark_backed_up(m_added);

    ASSERT_FALSE(m_service.backup_all(wallet, m_key).has_value());
    ASSERT_EQ(m_store->m_last_backup_size, 2UL);
    ASSERT_GT(wallet[0].m_last_backup_at.value(), m_added);
    ASSERT_TRUE(wallet[1].m_last_backup_at.has_value());

    m_store->m_fail_backup = true;
    auto err = m_service.backup_all(wallet, m_key);
    ASSERT_TRUE(err.has_value());
    ASSERT_TRUE(std::holds_alternative<evoucher::operational_error>(*err));
}

TEST_F(backup_test, restore_marks_backed_up) {
    m_store->m_stored[m_key] = {*m_a, *m_b};

    auto res = m_service.restore(m_key);
    auto& restored
        = std::get<std::vector<evoucher::backup::stored_voucher>>(res);
    ASSERT_EQ(restored.size(), 2UL);
    for(const auto& v : restored) {
        ASSERT_FALSE(v.needs_backup());
        ASSERT_FALSE(v.m_cached_status.has_value());
    }
}

TEST_F(backup_test, merge_prefers_local_and_keeps_order) {
    auto local_b = evoucher::backup::stored_voucher(*m_b, m_added, "mine");
    auto local_a = evoucher::backup::stored_voucher(*m_a, m_added);
    local_a.update_status(evoucher::voucher_status::redeemed, m_added);
    auto local = std::vector<evoucher::backup::stored_voucher>{local_b,
                                                               local_a};
    m_store->m_stored[m_key] = {*m_c, *m_a};

    auto res = m_service.restore_and_merge(local, m_key);
    auto& merged
        = std::get<std::vector<evoucher::backup::stored_voucher>>(res);

    ASSERT_EQ(merged.size(), 3UL);
    ASSERT_EQ(ids(merged),
              (std::vector<evoucher::voucher_id_t>{m_b->voucher_id(),
                                                   m_a->voucher_id(),
                                                   m_c->voucher_id()}));
    ASSERT_EQ(merged[0], local_b);
    ASSERT_EQ(merged[1], local_a);
    ASSERT_EQ(merged[1].m_cached_status, evoucher::voucher_status::redeemed);
    ASSERT_FALSE(merged[1].m_last_backup_at.has_value());
    ASSERT_TRUE(merged[2].m_last_backup_at.has_value());
}

TEST_F(backup_test, merge_restore_failure) {
    m_store->m_fail_restore = true;
    auto res = m_service.restore_and_merge({}, m_key);
    ASSERT_TRUE(std::holds_alternative<evoucher::operational_error>(res));
    ASSERT_EQ(std::get<evoucher::operational_error>(res).m_message,
              "Failed to restore vouchers: relay unreachable");
}

TEST_F(backup_test, verify_backup) {
    m_store->m_stored[m_key] = {*m_a, *m_b};

    auto res = m_service.verify_backup({m_a->voucher_id(), m_b->voucher_id()},
                                       m_key);
    ASSERT_TRUE(std::get<bool>(res));

    res = m_service.verify_backup({m_a->voucher_id(), m_c->voucher_id()},
                                  m_key);
    ASSERT_FALSE(std::get<bool>(res));

    res = m_service.verify_backup({}, m_key);
    ASSERT_TRUE(std::get<bool>(res));

    m_store->m_fail_restore = true;
    res = m_service.verify_backup({m_a->voucher_id()}, m_key);
    ASSERT_FALSE(std::get<bool>(res));
}

TEST_F(backup_test, in_memory_snapshots) {
    auto store = evoucher::backup::in_memory_backup();
    ASSERT_FALSE(std::get<bool>(store.has_backups(m_key)));

    ASSERT_FALSE(store.backup({*m_a, *m_b}, m_key));
    ASSERT_FALSE(store.backup({*m_c, *m_a}, m_key));
    ASSERT_FALSE(store.backup({*m_c}, "other-user"));
    ASSERT_EQ(store.snapshot_count(m_key), 2UL);

    auto res = store.restore(m_key);
    auto& restored = std::get<std::vector<evoucher::signed_voucher>>(res);
    ASSERT_EQ(restored,
              (std::vector<evoucher::signed_voucher>{*m_a, *m_b, *m_c}));
    ASSERT_TRUE(std::get<bool>(store.has_backups(m_key)));

    ASSERT_FALSE(store.delete_backups(m_key));
    ASSERT_EQ(store.snapshot_count(m_key), 0UL);
    ASSERT_FALSE(std::get<bool>(store.has_backups(m_key)));
    ASSERT_TRUE(std::get<bool>(store.has_backups("other-user")));
}

TEST_F(backup_test, in_memory_round_trip_through_service) {
    auto store = std::make_shared<evoucher::backup::in_memory_backup>(
        evoucher::test::quiet_log());
    auto service
        = evoucher::backup::backup_service(store, evoucher::test::quiet_log());
    auto wallet = std::vector<evoucher::backup::stored_voucher>{
        evoucher::backup::stored_voucher(*m_a, m_added),
        evoucher::backup::stored_voucher(*m_b, m_added)};

    ASSERT_EQ(std::get<size_t>(service.backup_if_needed(wallet, m_key)),
              2UL);

    auto res = service.restore_and_merge({}, m_key);
    auto& merged
        = std::get<std::vector<evoucher::backup::stored_voucher>>(res);
    ASSERT_EQ(ids(merged),
              (std::vector<evoucher::voucher_id_t>{m_a->voucher_id(),
                                                   m_b->voucher_id()}));
    ASSERT_TRUE(merged[0].m_voucher.verify(*m_engine));
}

TEST_F(backup_test, default_delete_not_supported) {
    auto err = m_store->delete_backups(m_key);
    ASSERT_TRUE(err.has_value());
    ASSERT_EQ(err->m_message,
              "delete_backups is not supported by this backup store");
}
