// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef EVOUCHER_SRC_MERCHANT_VERIFICATION_H_
#define EVOUCHER_SRC_MERCHANT_VERIFICATION_H_

#include "ledger/interface.hpp"
#include "payment_request.hpp"
#include "util/common/logging.hpp"
#include "voucher/signature.hpp"
#include "voucher/validation.hpp"

#include <memory>

namespace evoucher::merchant {
    /// Ledger status reasons reported by \ref verifier::verify_online.
    static constexpr auto not_in_ledger_error
        = "Voucher not found in public ledger";
    static constexpr auto double_spend_error
        = "Voucher already redeemed (double-spend attempt detected)";
    static constexpr auto revoked_error = "Voucher has been revoked by issuer";

    /// Request to redeem a voucher at a merchant.
    struct redeem_request {
        /// Merchant redeeming the voucher; must be the voucher's issuer.
        std::string m_merchant_id;
        /// Whether to check the ledger before redeeming. Offline
        /// redemption cannot detect double-spends.
        bool m_verify_online{true};
    };

    /// Outcome of a redemption.
    enum class redeem_status : uint8_t {
        /// Verified and recorded as redeemed in the ledger.
        redeemed,
        /// Verification failed; nothing was recorded.
        rejected,
        /// Verification passed but the ledger update failed. The voucher
        /// must not be honoured and the state needs manual reconciliation.
        unrecorded
    };

    /// Result of \ref verifier::redeem.
    struct redeem_response {
        redeem_status m_status{redeem_status::rejected};
        /// The redeemed voucher, on success.
        std::optional<signed_voucher> m_voucher;
        /// Failure description, when not redeemed.
        std::optional<std::string> m_error_message;

        /// Indicates whether the voucher was redeemed.
        [[nodiscard]] auto is_success() const -> bool;

        /// Face value of the redeemed voucher.
        [[nodiscard]] auto amount() const -> std::optional<int64_t>;
        /// Unit of the redeemed voucher.
        [[nodiscard]] auto unit() const -> std::optional<std::string>;
        /// ID of the redeemed voucher.
        [[nodiscard]] auto voucher_id() const -> std::optional<voucher_id_t>;
    };

    /// Either a validation outcome or a rejected argument.
    using verify_result = std::variant<validation::result, precondition_error>;

    /// \brief Verifies and redeems vouchers on behalf of a merchant.
    ///
    /// Vouchers are only redeemable at the merchant that issued them. Online
    /// verification consults the ledger and fails closed on any status
    /// other than ISSUED.
    class verifier {
      public:
        /// Constructor.
        /// \param ledger ledger to query and update.
        /// \param engine signature engine for issuer signature checks.
        /// \param logger log instance; nullptr disables logging.
        verifier(std::shared_ptr<ledger::interface> ledger,
                 std::shared_ptr<signature_engine> engine,
                 std::shared_ptr<logging::log> logger);

        /// \brief Verifies a voucher without contacting the ledger.
        ///
        /// Checks the issuer, the signature and the expiry, reporting every
        /// failure. Cannot detect double-spends.
        /// \param voucher voucher to verify.
        /// \param expected_issuer_id merchant performing the verification.
        /// \param now current time in Unix seconds.
        /// \return the validation outcome, or a precondition error for a
        ///         blank expected issuer.
        auto verify_offline(const signed_voucher& voucher,
                            const std::string& expected_issuer_id,
                            int64_t now) -> verify_result;

        auto verify_offline(const signed_voucher& voucher,
                            const std::string& expected_issuer_id)
            -> verify_result;

        /// \brief Verifies a voucher offline, then checks its ledger status.
        ///
        /// The ledger is not queried when offline verification fails. A
        /// ledger failure is reported as a validation failure.
        /// \param voucher voucher to verify.
        /// \param expected_issuer_id merchant performing the verification.
        /// \param now current time in Unix seconds.
        /// \return the validation outcome, or a precondition error for a
        ///         blank expected issuer.
        auto verify_online(const signed_voucher& voucher,
                           const std::string& expected_issuer_id,
                           int64_t now) -> verify_result;

        auto verify_online(const signed_voucher& voucher,
                           const std::string& expected_issuer_id)
            -> verify_result;

        /// Records a voucher as redeemed in the ledger.
        /// \param voucher_id voucher to mark.
        /// \return std::nullopt on success, or an operational error wrapping
        ///         the ledger failure.
        auto mark_redeemed(const voucher_id_t& voucher_id)
            -> std::optional<operational_error>;

        /// Verifies a voucher online or offline, as requested, and records
        /// it as redeemed if verification passes.
        /// \param request redemption request.
        /// \param voucher voucher presented by the customer.
        /// \return redemption outcome.
        auto redeem(const redeem_request& request,
                    const signed_voucher& voucher) -> redeem_response;

        /// Checks a payment payload against the request it answers,
        /// reporting every mismatch.
        /// \param payload customer's payment.
        /// \param request merchant's original request.
        /// \return validation outcome.
        auto validate_payment_payload(const payment_payload& payload,
                                      const payment_request& request)
            -> validation::result;

        /// Validates a payment payload and logs the accepted total.
        /// \see validate_payment_payload
        auto process_payment_payload(const payment_payload& payload,
                                     const payment_request& request)
            -> validation::result;

      private:
        std::shared_ptr<ledger::interface> m_ledger;
        std::shared_ptr<signature_engine> m_engine;
        std::shared_ptr<logging::log> m_log;

        auto check_ledger_status(const signed_voucher& voucher)
            -> validation::result;
    };

    /// Formats the Model B issuer mismatch reason.
    auto model_b_issuer_error(const std::string& actual,
                              const std::string& expected) -> std::string;
}

#endif // EVOUCHER_SRC_MERCHANT_VERIFICATION_H_
