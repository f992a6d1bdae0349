// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "../util.hpp"
#include "backup/backup_service.hpp"
#include "issuance/issuance_service.hpp"
#include "issuance/voucher_service.hpp"
#include "ledger/in_memory_ledger.hpp"
#include "merchant/verification.hpp"
#include "util/common/clock.hpp"
#include "util/common/random_source.hpp"

#include <gtest/gtest.h>
#include <json/json.h>
#include <limits>

class issuance_test : public ::testing::Test {
  protected:
    void SetUp() override {
        m_request.m_issuer_id = "merchant-a";
        m_request.m_unit = "sat";
        m_request.m_amount = 1000;
    }

    auto make_service(std::shared_ptr<evoucher::random_source> rng)
        -> std::shared_ptr<evoucher::issuance::voucher_service> {
        return std::make_shared<evoucher::issuance::voucher_service>(
            m_ledger,
            m_store,
            m_engine,
            std::move(rng),
            evoucher::test::privkey(evoucher::test::issuer_privkey_hex),
            evoucher::test::quiet_log());
    }

    auto issue() -> evoucher::issuance::issue_result {
        return m_service->issue(m_request, m_now);
    }

    auto precondition(const evoucher::issuance::issue_result& res)
        -> std::string {
        const auto* err = std::get_if<evoucher::precondition_error>(&res);
        EXPECT_NE(err, nullptr);
        return err != nullptr ? err->m_message : std::string();
    }

    static constexpr int64_t m_now{1700000000};

    std::shared_ptr<evoucher::signature_engine> m_engine{
        evoucher::test::make_engine()};
    std::shared_ptr<evoucher::test::counting_ledger> m_ledger{
        std::make_shared<evoucher::test::counting_ledger>()};
    std::shared_ptr<evoucher::test::counting_backup> m_store{
        std::make_shared<evoucher::test::counting_backup>()};
    std::shared_ptr<evoucher::issuance::voucher_service> m_service{
        make_service(std::make_shared<evoucher::random_source>())};
    evoucher::issuance::issue_request m_request;
};

TEST_F(issuance_test, issue_publishes_signed_voucher) {
    m_request.m_expires_in_days = 30;
    m_request.m_memo = "Birthday gift";

    auto res = issue();
    const auto& resp = std::get<evoucher::issuance::issue_response>(res);
    const auto& v = resp.m_voucher;

    ASSERT_EQ(resp.amount(), 1000);
    ASSERT_EQ(resp.unit(), "sat");
    ASSERT_EQ(v.issuer_id(), "merchant-a");
    ASSERT_EQ(v.memo(), "Birthday gift");
    ASSERT_EQ(v.expires_at(), m_now + 30 * evoucher::seconds_per_day);
    ASSERT_EQ(v.get_backing_strategy(), evoucher::backing_strategy::fixed);
    ASSERT_TRUE(v.verify(*m_engine));
    ASSERT_EQ(v.issuer_pubkey(), m_service->issuer_pubkey().value());

    ASSERT_EQ(m_ledger->m_publish_calls.load(), 1UL);
    ASSERT_EQ(m_ledger->m_statuses[resp.voucher_id()],
              evoucher::voucher_status::issued);
}

TEST_F(issuance_test, generated_ids_are_unique) {
    auto first = std::get<evoucher::issuance::issue_response>(issue());
    auto second = std::get<evoucher::issuance::issue_response>(issue());
    ASSERT_NE(first.voucher_id(), second.voucher_id());
}

TEST_F(issuance_test, custom_voucher_id) {
    m_request.m_voucher_id = "6ba7b810-9dad-11d1-80b4-00c04fd430c8";
    auto res = issue();
    const auto& resp = std::get<evoucher::issuance::issue_response>(res);
    ASSERT_EQ(evoucher::format_voucher_id(resp.voucher_id()),
              "6ba7b810-9dad-11d1-80b4-00c04fd430c8");

    m_request.m_voucher_id = "not-a-uuid";
    ASSERT_EQ(precondition(issue()),
              "Invalid voucher ID format: must be a valid UUID (e.g., "
              "550e8400-e29b-41d4-a716-446655440000)");
}

TEST_F(issuance_test, request_preconditions) {
    auto check = [&](evoucher::issuance::issue_request req,
                     const std::string& expected) {
        auto res = m_service->issue(req, m_now);
        ASSERT_EQ(precondition(res), expected);
    };

    auto req = m_request;
    req.m_issuer_id = " ";
    check(req, "Issuer ID is required");

    req = m_request;
    req.m_unit = "";
    check(req, "Unit is required");

    req = m_request;
    req.m_amount = 0;
    check(req, "Amount must be positive");
    req.m_amount = -5;
    check(req, "Amount must be positive");

    req = m_request;
    req.m_expires_in_days = 0;
    check(req, "Expiry days must be positive if specified");

    req.m_expires_in_days = std::numeric_limits<int64_t>::max();
    check(req,
          "Expiry days out of range: "
              + std::to_string(std::numeric_limits<int64_t>::max()));

    ASSERT_EQ(m_ledger->calls(), 0UL);
}

TEST_F(issuance_test, secret_invariants_surface) {
    m_request.m_backing_strategy = evoucher::backing_strategy::proportional;
    m_request.m_issuance_ratio = 0.0;
    auto res = issue();
    ASSERT_TRUE(std::holds_alternative<evoucher::precondition_error>(res));
    ASSERT_EQ(m_ledger->calls(), 0UL);
}

TEST_F(issuance_test, merchant_metadata_is_signed) {
    auto metadata = Json::Value(Json::objectValue);
    metadata["store"] = "north";
    metadata["lane"] = 3;
    m_request.m_merchant_metadata = metadata;

    auto res = issue();
    const auto& resp = std::get<evoucher::issuance::issue_response>(res);
    ASSERT_EQ(resp.m_voucher.secret().merchant_metadata(),
              R"({"lane":3,"store":"north"})");
    ASSERT_TRUE(resp.m_voucher.verify(*m_engine));
}

TEST_F(issuance_test, publish_failure) {
    m_ledger->m_fail_publish = true;
    auto res = issue();
    ASSERT_EQ(std::get<evoucher::operational_error>(res).m_message,
              "Failed to publish voucher to ledger: relay unreachable");
}

TEST_F(issuance_test, no_randomness) {
    auto service = make_service(
        std::make_shared<evoucher::random_source>("/nonexistent/entropy"));
    auto res = service->issue(m_request, m_now);
    ASSERT_EQ(std::get<evoucher::operational_error>(res).m_message,
              "Failed to generate voucher ID: no randomness available");
    ASSERT_EQ(m_ledger->calls(), 0UL);
}

TEST_F(issuance_test, invalid_issuer_key) {
    auto service = std::make_shared<evoucher::issuance::voucher_service>(
        m_ledger,
        m_store,
        m_engine,
        std::make_shared<evoucher::random_source>(),
        evoucher::privkey_t{},
        evoucher::test::quiet_log());
    ASSERT_FALSE(service->issuer_pubkey().has_value());

    auto res = service->issue(m_request, m_now);
    ASSERT_TRUE(std::holds_alternative<evoucher::precondition_error>(res));
    ASSERT_EQ(m_ledger->calls(), 0UL);
}

TEST_F(issuance_test, status_facade) {
    auto res = issue();
    const auto id = std::get<evoucher::issuance::issue_response>(res)
                        .voucher_id();

    auto status = m_service->query_status(id);
    ASSERT_EQ(std::get<std::optional<evoucher::voucher_status>>(status),
              evoucher::voucher_status::issued);
    ASSERT_TRUE(std::get<bool>(m_service->exists(id)));

    ASSERT_FALSE(
        m_service->update_status(id, evoucher::voucher_status::revoked));
    status = m_service->query_status(id);
    ASSERT_EQ(std::get<std::optional<evoucher::voucher_status>>(status),
              evoucher::voucher_status::revoked);

    auto unknown = evoucher::test::voucher_id(
        "00000000-0000-4000-8000-000000000000");
    status = m_service->query_status(unknown);
    ASSERT_FALSE(std::get<std::optional<evoucher::voucher_status>>(status)
                     .has_value());
    ASSERT_FALSE(std::get<bool>(m_service->exists(unknown)));

    m_ledger->m_fail_query = true;
    status = m_service->query_status(id);
    ASSERT_EQ(std::get<evoucher::operational_error>(status).m_message,
              "Failed to query voucher status: query timed out");
    auto exists = m_service->exists(id);
    ASSERT_TRUE(std::holds_alternative<evoucher::operational_error>(exists));

    m_ledger->m_fail_update = true;
    auto err = m_service->update_status(id, evoucher::voucher_status::expired);
    ASSERT_TRUE(err.has_value());
    ASSERT_EQ(err->m_message, "Failed to update voucher status: write rejected");
}

TEST_F(issuance_test, refresh_stale_statuses) {
    auto a = std::get<evoucher::issuance::issue_response>(issue()).m_voucher;
    auto b = std::get<evoucher::issuance::issue_response>(issue()).m_voucher;
    auto wallet = std::vector<evoucher::backup::stored_voucher>{
        evoucher::backup::stored_voucher(a, m_now),
        evoucher::backup::stored_voucher(b, m_now)};
    wallet[0].update_status(evoucher::voucher_status::issued, m_now);
    ASSERT_FALSE(
        m_service->update_status(b.voucher_id(),
                                 evoucher::voucher_status::revoked));

    const auto queries = m_ledger->m_query_calls.load();
    auto res = m_service->refresh_stale_statuses(wallet, 300, m_now + 10);
    ASSERT_EQ(std::get<size_t>(res), 1UL);
    ASSERT_EQ(m_ledger->m_query_calls.load(), queries + 1);
    ASSERT_EQ(wallet[0].m_status_updated_at, m_now);
    ASSERT_EQ(wallet[1].m_cached_status, evoucher::voucher_status::revoked);
    ASSERT_EQ(wallet[1].m_status_updated_at, m_now + 10);

    res = m_service->refresh_stale_statuses(wallet, 300, m_now + 400);
    ASSERT_EQ(std::get<size_t>(res), 2UL);

    // Entries the ledger does not know keep their cached status.
    m_ledger->m_statuses.erase(a.voucher_id());
    res = m_service->refresh_stale_statuses(wallet, 300, m_now + 800);
    ASSERT_EQ(std::get<size_t>(res), 1UL);
    ASSERT_EQ(wallet[0].m_cached_status, evoucher::voucher_status::issued);
    ASSERT_EQ(wallet[0].m_status_updated_at, m_now + 400);

    auto opts = evoucher::config::options();
    opts.m_status_stale_seconds = 300;
    res = m_service->refresh_stale_statuses(wallet, opts);
    ASSERT_EQ(std::get<size_t>(res), 1UL);
    ASSERT_GT(wallet[1].m_status_updated_at.value(), m_now + 800);

    m_ledger->m_fail_query = true;
    res = m_service->refresh_stale_statuses(wallet, 300, m_now + 1200);
    ASSERT_EQ(std::get<evoucher::operational_error>(res).m_message,
              "Failed to query voucher status: query timed out");
}

TEST_F(issuance_test, backup_facade) {
    auto a = std::get<evoucher::issuance::issue_response>(issue()).m_voucher;
    auto b = std::get<evoucher::issuance::issue_response>(issue()).m_voucher;

    auto err = m_service->backup({}, "user-secret");
    ASSERT_FALSE(err.has_value());
    ASSERT_EQ(m_store->m_backup_calls, 0UL);

    err = m_service->backup({a, b}, " ");
    ASSERT_TRUE(err.has_value());
    ASSERT_EQ(evoucher::error_message(err.value()),
              evoucher::backup::blank_user_key_error);

    ASSERT_FALSE(m_service->backup({a, b}, "user-secret").has_value());
    auto restored = m_service->restore("user-secret");
    ASSERT_EQ(std::get<std::vector<evoucher::signed_voucher>>(restored),
              (std::vector<evoucher::signed_voucher>{a, b}));

    m_store->m_fail_backup = true;
    err = m_service->backup({a}, "user-secret");
    ASSERT_TRUE(err.has_value());
    ASSERT_TRUE(std::holds_alternative<evoucher::operational_error>(*err));

    m_store->m_fail_restore = true;
    restored = m_service->restore("user-secret");
    ASSERT_EQ(std::get<evoucher::operational_error>(restored).m_message,
              "Failed to restore vouchers: relay unreachable");

    restored = m_service->restore("");
    ASSERT_TRUE(std::holds_alternative<evoucher::precondition_error>(restored));
}

TEST_F(issuance_test, payment_request_facade) {
    auto params = evoucher::merchant::payment_request_params();
    params.m_issuer_id = "merchant-a";
    params.m_amount = 250;
    params.m_unit = "sat";

    auto res = m_service->generate_payment_request(params);
    const auto& req = std::get<evoucher::merchant::payment_request>(res);
    ASSERT_EQ(req.m_amount, 250);
    ASSERT_EQ(req.m_payment_id->size(), evoucher::merchant::payment_id_len);
    ASSERT_EQ(req.m_transports.size(), 1UL);
}

TEST_F(issuance_test, redeemed_status_recorded_once) {
    auto ledger = std::make_shared<evoucher::ledger::in_memory_ledger>(
        evoucher::test::quiet_log());
    auto service = evoucher::issuance::voucher_service(
        ledger,
        m_store,
        m_engine,
        std::make_shared<evoucher::random_source>(),
        evoucher::test::privkey(evoucher::test::issuer_privkey_hex),
        evoucher::test::quiet_log());

    auto res = service.issue(m_request);
    const auto& voucher
        = std::get<evoucher::issuance::issue_response>(res).m_voucher;
    ASSERT_FALSE(voucher.expires_at().has_value());

    ASSERT_FALSE(
        service.update_status(voucher.voucher_id(),
                              evoucher::voucher_status::redeemed));
    ASSERT_TRUE(
        service.update_status(voucher.voucher_id(),
                              evoucher::voucher_status::redeemed));
}

class issuance_policy_test : public issuance_test {
  protected:
    auto make_policy_service(evoucher::issuance::issuance_policy policy)
        -> std::variant<evoucher::issuance::issuance_service,
                        evoucher::precondition_error> {
        return evoucher::issuance::issuance_service::create(
            m_service,
            policy,
            evoucher::test::quiet_log());
    }
};

TEST_F(issuance_policy_test, create_checks_limits) {
    auto res = make_policy_service({0, 30});
    ASSERT_EQ(std::get<evoucher::precondition_error>(res).m_message,
              "Max voucher amount must be positive");

    res = make_policy_service({1000, 0});
    ASSERT_EQ(std::get<evoucher::precondition_error>(res).m_message,
              "Max expiry days must be positive");

    res = make_policy_service({1000, 30});
    const auto& svc = std::get<evoucher::issuance::issuance_service>(res);
    ASSERT_EQ(svc.policy().m_max_voucher_amount, 1000);
    ASSERT_EQ(svc.policy().m_max_expiry_days, 30);
}

TEST_F(issuance_policy_test, from_options) {
    auto opts = evoucher::config::options();
    opts.m_max_voucher_amount = 5000;
    opts.m_max_expiry_days = 7;
    auto policy = evoucher::issuance::issuance_policy::from_options(opts);
    ASSERT_EQ(policy.m_max_voucher_amount, 5000);
    ASSERT_EQ(policy.m_max_expiry_days, 7);

    auto defaults = evoucher::issuance::issuance_policy();
    ASSERT_EQ(defaults.m_max_voucher_amount,
              evoucher::config::defaults::max_voucher_amount);
    ASSERT_EQ(defaults.m_max_expiry_days,
              evoucher::config::defaults::max_expiry_days);
}

TEST_F(issuance_policy_test, rejects_before_signing_or_publishing) {
    auto res = make_policy_service({1000, 30});
    auto& svc = std::get<evoucher::issuance::issuance_service>(res);

    m_request.m_amount = 1001;
    auto issued = svc.issue(m_request, m_now);
    ASSERT_EQ(precondition(issued),
              "Voucher amount 1001 exceeds maximum allowed 1000");

    m_request.m_amount = 1000;
    m_request.m_expires_in_days = 31;
    issued = svc.issue(m_request);
    ASSERT_EQ(precondition(issued),
              "Voucher expiry 31 days exceeds maximum allowed 30 days");
    ASSERT_EQ(m_ledger->calls(), 0UL);

    m_request.m_expires_in_days = 30;
    issued = svc.issue(m_request, m_now);
    ASSERT_TRUE(
        std::holds_alternative<evoucher::issuance::issue_response>(issued));
    ASSERT_EQ(m_ledger->m_publish_calls.load(), 1UL);
}

TEST_F(issuance_policy_test, delegated_errors_pass_through) {
    auto res = make_policy_service({1000, 30});
    auto& svc = std::get<evoucher::issuance::issuance_service>(res);

    m_request.m_amount = -1;
    ASSERT_EQ(precondition(svc.issue(m_request, m_now)),
              "Amount must be positive");
}

TEST_F(issuance_test, services_accept_null_logger) {
    auto service = std::make_shared<evoucher::issuance::voucher_service>(
        m_ledger,
        m_store,
        m_engine,
        std::make_shared<evoucher::random_source>(),
        evoucher::test::privkey(evoucher::test::issuer_privkey_hex),
        nullptr);
    auto created = evoucher::issuance::issuance_service::create(
        service,
        evoucher::issuance::issuance_policy{},
        nullptr);
    auto& policy_svc
        = std::get<evoucher::issuance::issuance_service>(created);
    auto res = policy_svc.issue(m_request, m_now);
    const auto voucher
        = std::get<evoucher::issuance::issue_response>(res).m_voucher;

    auto verifier = evoucher::merchant::verifier(m_ledger, m_engine, nullptr);
    auto verified = verifier.verify_online(voucher, "merchant-a", m_now);
    ASSERT_TRUE(std::get<evoucher::validation::result>(verified).is_valid());

    auto backups = evoucher::backup::backup_service(m_store, nullptr);
    auto wallet = std::vector<evoucher::backup::stored_voucher>{
        evoucher::backup::stored_voucher(voucher, m_now)};
    auto backed_up = backups.backup_if_needed(wallet, "user-secret");
    ASSERT_EQ(std::get<size_t>(backed_up), 1UL);
}
