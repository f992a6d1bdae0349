// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef EVOUCHER_TESTS_UTIL_H_
#define EVOUCHER_TESTS_UTIL_H_

#include "backup/interface.hpp"
#include "ledger/interface.hpp"
#include "util/common/keys.hpp"
#include "util/common/logging.hpp"
#include "voucher/secret.hpp"
#include "voucher/signature.hpp"

#include <atomic>
#include <gtest/gtest.h>
#include <map>
#include <memory>

namespace evoucher::test {
    /// Issuer private key used throughout the tests.
    static constexpr auto issuer_privkey_hex
        = "0000000000000000000000000000000000000000000000000000000000000001";
    /// A second, unrelated private key.
    static constexpr auto other_privkey_hex
        = "0000000000000000000000000000000000000000000000000000000000000002";

    /// Parses one of the hex keys above.
    auto privkey(const std::string& hex) -> privkey_t;

    /// Logger writing nowhere, at the most verbose level so every log
    /// statement is evaluated.
    auto quiet_log() -> std::shared_ptr<logging::log>;

    /// Signature engine reading /dev/urandom.
    auto make_engine() -> std::shared_ptr<signature_engine>;

    /// Terms of a valid voucher: issuer "merchant-a", 1000 "sat", with the
    /// given ID and no expiry.
    auto sample_terms(const std::string& voucher_id
                      = "550e8400-e29b-41d4-a716-446655440000")
        -> voucher_terms;

    /// Builds a secret from terms, failing the test if they are invalid.
    auto make_secret(const voucher_terms& terms) -> voucher_secret;

    /// Signs terms with the issuer key, failing the test on error.
    auto make_signed(const signature_engine& engine,
                     const voucher_terms& terms) -> signed_voucher;

    /// Parses a voucher ID, failing the test if it is malformed.
    auto voucher_id(const std::string& str) -> voucher_id_t;

    /// \brief Ledger double that counts calls and injects failures.
    ///
    /// Statuses are held in a plain map with no transition checks, so
    /// tests can stage any status, including unknown.
    class counting_ledger : public ledger::interface {
      public:
        [[nodiscard]] auto publish(const signed_voucher& voucher,
                                   voucher_status status)
            -> std::optional<port_error> override;
        [[nodiscard]] auto query_status(const voucher_id_t& voucher_id)
            -> ledger::status_result override;
        [[nodiscard]] auto update_status(const voucher_id_t& voucher_id,
                                         voucher_status status)
            -> std::optional<port_error> override;

        /// Total calls to any Port operation.
        [[nodiscard]] auto calls() const -> size_t;

        std::map<voucher_id_t, voucher_status> m_statuses;
        std::atomic<size_t> m_publish_calls{0};
        std::atomic<size_t> m_query_calls{0};
        std::atomic<size_t> m_update_calls{0};
        bool m_fail_publish{false};
        bool m_fail_query{false};
        bool m_fail_update{false};
    };

    /// Backup store double that keeps the latest backed-up list per key
    /// and injects failures.
    class counting_backup : public backup::interface {
      public:
        [[nodiscard]] auto backup(const std::vector<signed_voucher>& vouchers,
                                  const std::string& user_key)
            -> std::optional<port_error> override;
        [[nodiscard]] auto restore(const std::string& user_key)
            -> backup::restore_result override;

        std::map<std::string, std::vector<signed_voucher>> m_stored;
        size_t m_backup_calls{0};
        size_t m_restore_calls{0};
        /// Size of the list passed to the most recent backup call.
        size_t m_last_backup_size{0};
        bool m_fail_backup{false};
        bool m_fail_restore{false};
    };
}

#endif // EVOUCHER_TESTS_UTIL_H_
