// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "issuance_service.hpp"

namespace evoucher::issuance {
    auto issuance_policy::from_options(const config::options& opts)
        -> issuance_policy {
        return issuance_policy{opts.m_max_voucher_amount,
                               opts.m_max_expiry_days};
    }

    issuance_service::issuance_service(std::shared_ptr<voucher_service> service,
                                       issuance_policy policy,
                                       std::shared_ptr<logging::log> logger)
        : m_service(std::move(service)),
          m_policy(policy),
          m_log(logging::or_silent(std::move(logger))) {}

    auto issuance_service::create(std::shared_ptr<voucher_service> service,
                                  issuance_policy policy,
                                  std::shared_ptr<logging::log> logger)
        -> std::variant<issuance_service, precondition_error> {
        if(policy.m_max_voucher_amount <= 0) {
            return precondition_error{"Max voucher amount must be positive"};
        }
        if(policy.m_max_expiry_days <= 0) {
            return precondition_error{"Max expiry days must be positive"};
        }
        logger = logging::or_silent(std::move(logger));
        logger->info("Issuance service initialized: max amount",
                     policy.m_max_voucher_amount,
                     "max expiry days",
                     policy.m_max_expiry_days);
        return issuance_service(std::move(service), policy, std::move(logger));
    }

    auto issuance_service::check_policy(const issue_request& request) const
        -> std::optional<precondition_error> {
        if(request.m_amount > m_policy.m_max_voucher_amount) {
            return precondition_error{
                "Voucher amount " + std::to_string(request.m_amount)
                + " exceeds maximum allowed "
                + std::to_string(m_policy.m_max_voucher_amount)};
        }
        if(request.m_expires_in_days.has_value()
           && request.m_expires_in_days.value() > m_policy.m_max_expiry_days) {
            return precondition_error{
                "Voucher expiry "
                + std::to_string(request.m_expires_in_days.value())
                + " days exceeds maximum allowed "
                + std::to_string(m_policy.m_max_expiry_days) + " days"};
        }
        return std::nullopt;
    }

    auto issuance_service::issue(const issue_request& request, int64_t now)
        -> issue_result {
        auto err = check_policy(request);
        if(err.has_value()) {
            m_log->warn("Issuance rejected by policy:", err->m_message);
            return std::move(err.value());
        }
        return m_service->issue(request, now);
    }

    auto issuance_service::issue(const issue_request& request)
        -> issue_result {
        auto err = check_policy(request);
        if(err.has_value()) {
            m_log->warn("Issuance rejected by policy:", err->m_message);
            return std::move(err.value());
        }
        return m_service->issue(request);
    }

    auto issuance_service::policy() const -> const issuance_policy& {
        return m_policy;
    }
}
