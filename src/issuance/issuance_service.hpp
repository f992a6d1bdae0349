// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef EVOUCHER_SRC_ISSUANCE_ISSUANCE_SERVICE_H_
#define EVOUCHER_SRC_ISSUANCE_ISSUANCE_SERVICE_H_

#include "util/common/config.hpp"
#include "voucher_service.hpp"

namespace evoucher::issuance {
    /// Ceilings applied to every issuance request.
    struct issuance_policy {
        /// Largest face value accepted.
        int64_t m_max_voucher_amount{config::defaults::max_voucher_amount};
        /// Longest validity period accepted, in days.
        int64_t m_max_expiry_days{config::defaults::max_expiry_days};

        /// Reads the ceilings from the issuer configuration.
        static auto from_options(const config::options& opts)
            -> issuance_policy;
    };

    /// \brief Applies the issuance policy before delegating to the voucher
    ///        service.
    ///
    /// Out-of-policy requests are rejected before any signing or ledger
    /// activity.
    class issuance_service {
      public:
        /// Builds the service, checking that both ceilings are positive.
        /// \param service voucher service to delegate to.
        /// \param policy issuance ceilings.
        /// \param logger log instance; nullptr disables logging.
        /// \return the service, or the violated precondition.
        static auto create(std::shared_ptr<voucher_service> service,
                           issuance_policy policy,
                           std::shared_ptr<logging::log> logger)
            -> std::variant<issuance_service, precondition_error>;

        /// Checks the request against the policy and issues it.
        /// \see voucher_service::issue(const issue_request&)
        auto issue(const issue_request& request) -> issue_result;

        /// Issues at the given time.
        /// \see voucher_service::issue(const issue_request&, int64_t)
        auto issue(const issue_request& request, int64_t now) -> issue_result;

        /// Returns the ceilings in force.
        [[nodiscard]] auto policy() const -> const issuance_policy&;

      private:
        issuance_service(std::shared_ptr<voucher_service> service,
                         issuance_policy policy,
                         std::shared_ptr<logging::log> logger);

        std::shared_ptr<voucher_service> m_service;
        issuance_policy m_policy;
        std::shared_ptr<logging::log> m_log;

        [[nodiscard]] auto check_policy(const issue_request& request) const
            -> std::optional<precondition_error>;
    };
}

#endif // EVOUCHER_SRC_ISSUANCE_ISSUANCE_SERVICE_H_
