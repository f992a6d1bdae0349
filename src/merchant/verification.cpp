// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "verification.hpp"

#include "util/common/clock.hpp"
#include "util/common/strings.hpp"

namespace evoucher::merchant {
    auto redeem_response::is_success() const -> bool {
        return m_status == redeem_status::redeemed;
    }

    auto redeem_response::amount() const -> std::optional<int64_t> {
        if(!m_voucher.has_value()) {
            return std::nullopt;
        }
        return m_voucher->face_value();
    }

    auto redeem_response::unit() const -> std::optional<std::string> {
        if(!m_voucher.has_value()) {
            return std::nullopt;
        }
        return m_voucher->unit();
    }

    auto redeem_response::voucher_id() const -> std::optional<voucher_id_t> {
        if(!m_voucher.has_value()) {
            return std::nullopt;
        }
        return m_voucher->voucher_id();
    }

    auto model_b_issuer_error(const std::string& actual,
                              const std::string& expected) -> std::string {
        return "Voucher issued by '" + actual + "' but expected issuer is '"
             + expected
             + "' (Model B: vouchers only redeemable at issuing merchant)";
    }

    verifier::verifier(std::shared_ptr<ledger::interface> ledger,
                       std::shared_ptr<signature_engine> engine,
                       std::shared_ptr<logging::log> logger)
        : m_ledger(std::move(ledger)),
          m_engine(std::move(engine)),
          m_log(logging::or_silent(std::move(logger))) {}

    auto verifier::verify_offline(const signed_voucher& voucher,
                                  const std::string& expected_issuer_id,
                                  int64_t now) -> verify_result {
        if(is_blank(expected_issuer_id)) {
            return precondition_error{"Expected issuer ID cannot be blank"};
        }

        const auto id_str = format_voucher_id(voucher.voucher_id());
        m_log->debug("Performing offline verification:",
                     id_str,
                     "expected issuer",
                     expected_issuer_id);

        auto errors = std::vector<std::string>();
        if(voucher.issuer_id() != expected_issuer_id) {
            auto err = model_b_issuer_error(voucher.issuer_id(),
                                            expected_issuer_id);
            m_log->warn("Issuer mismatch:", err);
            errors.emplace_back(std::move(err));
        }

        const auto domain = validation::validate(voucher, *m_engine, now);
        if(!domain.is_valid()) {
            m_log->warn("Domain validation failed:", domain.error_message());
            errors.insert(errors.end(),
                          domain.errors().begin(),
                          domain.errors().end());
        }

        if(errors.empty()) {
            m_log->debug("Offline verification passed:", id_str);
            return validation::result::success();
        }
        m_log->debug("Offline verification failed:",
                     id_str,
                     "with",
                     errors.size(),
                     "error(s)");
        return validation::result::failure(std::move(errors));
    }

    auto verifier::verify_offline(const signed_voucher& voucher,
                                  const std::string& expected_issuer_id)
        -> verify_result {
        return verify_offline(voucher, expected_issuer_id, unix_time_now());
    }

    auto verifier::verify_online(const signed_voucher& voucher,
                                 const std::string& expected_issuer_id,
                                 int64_t now) -> verify_result {
        const auto id_str = format_voucher_id(voucher.voucher_id());
        m_log->info("Performing online verification:",
                    id_str,
                    "expected issuer",
                    expected_issuer_id);

        auto offline = verify_offline(voucher, expected_issuer_id, now);
        if(std::holds_alternative<precondition_error>(offline)) {
            return offline;
        }
        if(!std::get<validation::result>(offline).is_valid()) {
            m_log->warn("Online verification failed at offline stage:",
                        id_str);
            return offline;
        }

        return check_ledger_status(voucher);
    }

    auto verifier::verify_online(const signed_voucher& voucher,
                                 const std::string& expected_issuer_id)
        -> verify_result {
        return verify_online(voucher, expected_issuer_id, unix_time_now());
    }

    auto verifier::check_ledger_status(const signed_voucher& voucher)
        -> validation::result {
        const auto id_str = format_voucher_id(voucher.voucher_id());
        auto res = m_ledger->query_status(voucher.voucher_id());
        if(std::holds_alternative<port_error>(res)) {
            const auto& msg = std::get<port_error>(res).m_message;
            m_log->error("Ledger query failed:", id_str, msg);
            return validation::result::failure(
                "Failed to query voucher status from ledger: " + msg);
        }

        const auto& status = std::get<std::optional<voucher_status>>(res);
        if(!status.has_value()) {
            m_log->warn("Online verification failed:",
                        id_str,
                        not_in_ledger_error);
            return validation::result::failure(not_in_ledger_error);
        }

        m_log->debug("Voucher ledger status:", id_str, to_string(*status));
        switch(status.value()) {
            case voucher_status::issued:
                m_log->info("Online verification passed:",
                            id_str,
                            "status ISSUED");
                return validation::result::success();
            case voucher_status::redeemed:
                m_log->warn("Double-spend detected:", id_str);
                return validation::result::failure(double_spend_error);
            case voucher_status::revoked:
                m_log->warn("Revoked voucher:", id_str);
                return validation::result::failure(revoked_error);
            case voucher_status::expired:
                m_log->warn("Expired voucher (ledger status):", id_str);
                return validation::result::failure(
                    validation::expired_error);
            case voucher_status::unknown:
                break;
        }

        m_log->error("Unknown status in ledger:",
                     id_str,
                     to_string(status.value()));
        return validation::result::failure("Unknown voucher status: "
                                           + to_string(status.value()));
    }

    auto verifier::mark_redeemed(const voucher_id_t& voucher_id)
        -> std::optional<operational_error> {
        const auto id_str = format_voucher_id(voucher_id);
        m_log->info("Marking voucher as redeemed:", id_str);

        auto err = m_ledger->update_status(voucher_id, voucher_status::redeemed);
        if(err.has_value()) {
            m_log->error("Failed to mark voucher as redeemed:",
                         id_str,
                         err->m_message);
            return operational_error{"Failed to mark voucher as redeemed: "
                                     + err->m_message};
        }

        m_log->info("Voucher marked as redeemed successfully:", id_str);
        return std::nullopt;
    }

    auto verifier::redeem(const redeem_request& request,
                          const signed_voucher& voucher) -> redeem_response {
        const auto id_str = format_voucher_id(voucher.voucher_id());
        m_log->info("Processing redemption request:",
                    id_str,
                    "merchant",
                    request.m_merchant_id);

        auto verified = verify_result(validation::result::success());
        if(request.m_verify_online) {
            verified = verify_online(voucher, request.m_merchant_id);
        } else {
            m_log->warn("Offline verification requested:",
                        id_str,
                        "- double-spend not prevented!");
            verified = verify_offline(voucher, request.m_merchant_id);
        }

        if(std::holds_alternative<precondition_error>(verified)) {
            auto& msg = std::get<precondition_error>(verified).m_message;
            m_log->warn("Redemption rejected:", id_str, msg);
            return redeem_response{redeem_status::rejected,
                                   std::nullopt,
                                   std::move(msg)};
        }

        const auto& result = std::get<validation::result>(verified);
        if(!result.is_valid()) {
            m_log->warn("Redemption rejected:", id_str, result.error_message());
            return redeem_response{redeem_status::rejected,
                                   std::nullopt,
                                   result.error_message()};
        }

        auto err = mark_redeemed(voucher.voucher_id());
        if(err.has_value()) {
            m_log->error("Redemption failed at marking stage:", id_str);
            return redeem_response{
                redeem_status::unrecorded,
                std::nullopt,
                "Verification passed but failed to mark as redeemed: "
                    + err->m_message};
        }

        m_log->info("Redemption successful:",
                    id_str,
                    "amount",
                    voucher.face_value());
        return redeem_response{redeem_status::redeemed, voucher, std::nullopt};
    }

    auto verifier::validate_payment_payload(const payment_payload& payload,
                                            const payment_request& request)
        -> validation::result {
        m_log->info("Validating payment payload:",
                    payload.m_id,
                    "for request",
                    request.m_payment_id.value_or(""));

        auto errors = std::vector<std::string>();

        if(request.m_payment_id.has_value()
           && !is_blank(request.m_payment_id.value())
           && request.m_payment_id.value() != payload.m_id) {
            errors.emplace_back("Payment ID mismatch: expected '"
                                + request.m_payment_id.value() + "', got '"
                                + payload.m_id + "'");
        }

        if(request.m_issuer_id != payload.m_issuer_id) {
            errors.emplace_back("Issuer ID mismatch: expected '"
                                + request.m_issuer_id + "', got '"
                                + payload.m_issuer_id + "'");
        }

        auto amounts_ok = true;
        for(size_t i = 0; i < payload.m_proofs.size(); i++) {
            const auto amount = payload.m_proofs[i].m_amount;
            if(amount <= 0) {
                amounts_ok = false;
                errors.emplace_back("Invalid proof amount at index "
                                    + std::to_string(i) + ": "
                                    + std::to_string(amount));
            }
        }

        const auto total = payload.total_amount();
        if(amounts_ok && !total.has_value()) {
            errors.emplace_back("Proof amounts overflow the payment total");
        }

        if(request.m_amount.has_value() && total.has_value()
           && total.value() < request.m_amount.value()) {
            errors.emplace_back("Insufficient amount: expected at least "
                                + std::to_string(request.m_amount.value())
                                + ", got " + std::to_string(total.value()));
        }

        if(!request.is_mint_permitted(payload.m_mint)) {
            errors.emplace_back("Mint '" + payload.m_mint
                                + "' not in permitted list: ["
                                + join(request.m_mints, ", ") + "]");
        }

        if(request.m_offline_verification && !payload.all_proofs_have_dleq()) {
            errors.emplace_back(
                "Offline verification required but proofs missing DLEQ");
        }

        if(errors.empty()) {
            m_log->info("Payment payload validation passed:", payload.m_id);
            return validation::result::success();
        }
        m_log->warn("Payment payload validation failed:",
                    payload.m_id,
                    "with",
                    errors.size(),
                    "error(s)");
        return validation::result::failure(std::move(errors));
    }

    auto verifier::process_payment_payload(const payment_payload& payload,
                                           const payment_request& request)
        -> validation::result {
        m_log->info("Processing payment payload:",
                    payload.m_id,
                    "with",
                    payload.proof_count(),
                    "proof(s)");

        auto result = validate_payment_payload(payload, request);
        if(!result.is_valid()) {
            return result;
        }

        m_log->info("Payment payload processed successfully:",
                    payload.m_id,
                    "total amount",
                    payload.total_amount().value_or(0));
        return result;
    }
}
