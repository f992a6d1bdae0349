// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef EVOUCHER_SRC_ISSUANCE_VOUCHER_SERVICE_H_
#define EVOUCHER_SRC_ISSUANCE_VOUCHER_SERVICE_H_

#include "backup/interface.hpp"
#include "backup/stored_voucher.hpp"
#include "ledger/interface.hpp"
#include "merchant/payment_request.hpp"
#include "util/common/config.hpp"
#include "util/common/keys.hpp"
#include "util/common/logging.hpp"
#include "util/common/random_source.hpp"
#include "voucher/signature.hpp"

#include <json/json.h>
#include <memory>

namespace evoucher::issuance {
    /// Fields of a voucher issuance request.
    struct issue_request {
        /// Issuing merchant. Required.
        std::string m_issuer_id;
        /// Unit of account. Required.
        std::string m_unit;
        /// Face value; must be positive.
        int64_t m_amount{};
        /// Validity period in days from issuance, if the voucher expires.
        std::optional<int64_t> m_expires_in_days;
        std::optional<std::string> m_memo;
        /// Voucher ID in UUID form; generated when absent or blank.
        std::optional<std::string> m_voucher_id;
        backing_strategy m_backing_strategy{backing_strategy::fixed};
        double m_issuance_ratio{1.0};
        int32_t m_face_decimals{0};
        /// Merchant metadata as a JSON object.
        Json::Value m_merchant_metadata{Json::nullValue};
    };

    /// Result of a successful issuance.
    struct issue_response {
        /// The signed, published voucher.
        signed_voucher m_voucher;

        [[nodiscard]] auto voucher_id() const -> const voucher_id_t&;
        [[nodiscard]] auto amount() const -> int64_t;
        [[nodiscard]] auto unit() const -> const std::string&;
    };

    /// Outcome of \ref voucher_service::issue.
    using issue_result
        = std::variant<issue_response, precondition_error, operational_error>;

    /// \brief Issuer-side entry point: issues vouchers and fronts the
    ///        ledger and backup stores.
    ///
    /// Arguments are checked before any signing or Port call. Port failures
    /// are reported as operational errors.
    class voucher_service {
      public:
        /// Constructor.
        /// \param ledger ledger new vouchers are published to.
        /// \param store backup store.
        /// \param engine signature engine.
        /// \param rng source for generated voucher and payment IDs.
        /// \param issuer_key private key vouchers are signed with.
        /// \param logger log instance; nullptr disables logging.
        voucher_service(std::shared_ptr<ledger::interface> ledger,
                        std::shared_ptr<backup::interface> store,
                        std::shared_ptr<signature_engine> engine,
                        std::shared_ptr<random_source> rng,
                        const privkey_t& issuer_key,
                        std::shared_ptr<logging::log> logger);

        /// \brief Issues a voucher.
        ///
        /// Builds the secret, signs it and publishes it to the ledger with
        /// status ISSUED.
        /// \param request issuance request.
        /// \param now issuance time in Unix seconds; expiry is computed from
        ///            it.
        /// \return the issued voucher, a precondition error for an invalid
        ///         request, or an operational error if publishing failed.
        auto issue(const issue_request& request, int64_t now) -> issue_result;

        /// \see issue(const issue_request&, int64_t) at the current time.
        auto issue(const issue_request& request) -> issue_result;

        /// Looks up the ledger status of a voucher.
        /// \return the status, std::nullopt if unknown, or the failure.
        auto query_status(const voucher_id_t& voucher_id)
            -> std::variant<std::optional<voucher_status>, operational_error>;

        /// Sets the ledger status of a voucher.
        auto update_status(const voucher_id_t& voucher_id,
                           voucher_status status)
            -> std::optional<operational_error>;

        /// Backs up vouchers. Does nothing for an empty list.
        /// \param vouchers vouchers to back up.
        /// \param user_key user secret the backup is bound to.
        auto backup(const std::vector<signed_voucher>& vouchers,
                    const std::string& user_key)
            -> std::optional<service_error>;

        /// Restores every voucher backed up under a key.
        auto restore(const std::string& user_key)
            -> std::variant<std::vector<signed_voucher>,
                            precondition_error,
                            operational_error>;

        /// \brief Re-fetches ledger statuses older than a threshold.
        ///
        /// Every wallet entry whose cached status is stale is queried and
        /// re-stamped. Entries the ledger has no record of keep their cached
        /// status. Stops at the first ledger failure.
        /// \param vouchers wallet entries to refresh in place.
        /// \param stale_seconds maximum acceptable age of a cached status.
        /// \param now current time in Unix seconds.
        /// \return number of entries refreshed, or the ledger failure.
        auto refresh_stale_statuses(std::vector<backup::stored_voucher>& vouchers,
                                    int64_t stale_seconds,
                                    int64_t now)
            -> std::variant<size_t, operational_error>;

        /// \see refresh_stale_statuses using the configured threshold at
        ///      the current time.
        auto refresh_stale_statuses(std::vector<backup::stored_voucher>& vouchers,
                                    const config::options& opts)
            -> std::variant<size_t, operational_error>;

        /// Checks whether the ledger has a record of a voucher.
        auto exists(const voucher_id_t& voucher_id)
            -> std::variant<bool, operational_error>;

        /// Builds a payment request for this issuer's vouchers.
        /// \see merchant::generate_payment_request
        auto generate_payment_request(
            const merchant::payment_request_params& params)
            -> std::variant<merchant::payment_request,
                            precondition_error,
                            operational_error>;

        /// Returns the public key matching the issuer key, if the key is
        /// valid.
        [[nodiscard]] auto issuer_pubkey() const -> std::optional<pubkey_t>;

      private:
        std::shared_ptr<ledger::interface> m_ledger;
        std::shared_ptr<backup::interface> m_store;
        std::shared_ptr<signature_engine> m_engine;
        std::shared_ptr<random_source> m_rng;
        privkey_t m_issuer_key;
        std::shared_ptr<logging::log> m_log;

        auto build_terms(const issue_request& request, int64_t now)
            -> std::variant<voucher_terms, precondition_error, operational_error>;
    };
}

#endif // EVOUCHER_SRC_ISSUANCE_VOUCHER_SERVICE_H_
