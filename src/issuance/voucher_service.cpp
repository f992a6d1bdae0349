// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "voucher_service.hpp"

#include "backup/backup_service.hpp"
#include "util/common/clock.hpp"
#include "util/common/strings.hpp"
#include "voucher/metadata.hpp"

#include <limits>

namespace evoucher::issuance {
    auto issue_response::voucher_id() const -> const voucher_id_t& {
        return m_voucher.voucher_id();
    }

    auto issue_response::amount() const -> int64_t {
        return m_voucher.face_value();
    }

    auto issue_response::unit() const -> const std::string& {
        return m_voucher.unit();
    }

    voucher_service::voucher_service(std::shared_ptr<ledger::interface> ledger,
                                     std::shared_ptr<backup::interface> store,
                                     std::shared_ptr<signature_engine> engine,
                                     std::shared_ptr<random_source> rng,
                                     const privkey_t& issuer_key,
                                     std::shared_ptr<logging::log> logger)
        : m_ledger(std::move(ledger)),
          m_store(std::move(store)),
          m_engine(std::move(engine)),
          m_rng(std::move(rng)),
          m_issuer_key(issuer_key),
          m_log(logging::or_silent(std::move(logger))) {
        const auto pubkey = issuer_pubkey();
        if(pubkey.has_value()) {
            m_log->info("Voucher service initialized with issuer public key",
                        to_hex(pubkey.value()).substr(0, 8) + "...");
        } else {
            m_log->warn("Voucher service initialized with an invalid issuer "
                        "key; issuance will fail");
        }
    }

    auto voucher_service::build_terms(const issue_request& request,
                                      int64_t now)
        -> std::variant<voucher_terms, precondition_error, operational_error> {
        if(is_blank(request.m_issuer_id)) {
            return precondition_error{"Issuer ID is required"};
        }
        if(is_blank(request.m_unit)) {
            return precondition_error{"Unit is required"};
        }
        if(request.m_amount <= 0) {
            return precondition_error{"Amount must be positive"};
        }

        auto terms = voucher_terms();
        if(request.m_expires_in_days.has_value()) {
            const auto days = request.m_expires_in_days.value();
            if(days <= 0) {
                return precondition_error{
                    "Expiry days must be positive if specified"};
            }
            if(days > (std::numeric_limits<int64_t>::max() - now)
                          / seconds_per_day) {
                return precondition_error{"Expiry days out of range: "
                                          + std::to_string(days)};
            }
            terms.m_expires_at = now + days * seconds_per_day;
            m_log->debug("Voucher will expire at",
                         terms.m_expires_at.value(),
                         "in",
                         days,
                         "days");
        }

        if(request.m_voucher_id.has_value()
           && !is_blank(request.m_voucher_id.value())) {
            const auto id = parse_voucher_id(request.m_voucher_id.value());
            if(!id.has_value()) {
                return precondition_error{
                    "Invalid voucher ID format: must be a valid UUID (e.g., "
                    "550e8400-e29b-41d4-a716-446655440000)"};
            }
            terms.m_voucher_id = id.value();
            m_log->debug("Created voucher with custom ID",
                         request.m_voucher_id.value());
        } else {
            const auto id = generate_voucher_id(*m_rng);
            if(!id.has_value()) {
                return operational_error{
                    "Failed to generate voucher ID: no randomness available"};
            }
            terms.m_voucher_id = id.value();
            m_log->debug("Created voucher with auto-generated ID",
                         format_voucher_id(terms.m_voucher_id));
        }

        terms.m_issuer_id = request.m_issuer_id;
        terms.m_unit = request.m_unit;
        terms.m_face_value = request.m_amount;
        terms.m_memo = request.m_memo;
        terms.m_backing_strategy = request.m_backing_strategy;
        terms.m_issuance_ratio = request.m_issuance_ratio;
        terms.m_face_decimals = request.m_face_decimals;
        terms.m_merchant_metadata
            = metadata_to_text(request.m_merchant_metadata);

        return terms;
    }

    auto voucher_service::issue(const issue_request& request, int64_t now)
        -> issue_result {
        m_log->info("Issuing voucher: issuer",
                    request.m_issuer_id,
                    "unit",
                    request.m_unit,
                    "amount",
                    request.m_amount);

        auto terms = build_terms(request, now);
        if(std::holds_alternative<precondition_error>(terms)) {
            return std::get<precondition_error>(std::move(terms));
        }
        if(std::holds_alternative<operational_error>(terms)) {
            return std::get<operational_error>(std::move(terms));
        }

        auto secret
            = voucher_secret::create(std::get<voucher_terms>(std::move(terms)));
        if(std::holds_alternative<precondition_error>(secret)) {
            return std::get<precondition_error>(std::move(secret));
        }

        auto signed_res = m_engine->create_signed(
            std::get<voucher_secret>(secret),
            m_issuer_key);
        if(std::holds_alternative<precondition_error>(signed_res)) {
            return std::get<precondition_error>(std::move(signed_res));
        }
        auto& voucher = std::get<signed_voucher>(signed_res);
        m_log->debug("Voucher signed successfully");

        const auto id_str = format_voucher_id(voucher.voucher_id());
        auto err = m_ledger->publish(voucher, voucher_status::issued);
        if(err.has_value()) {
            m_log->error("Failed to publish voucher to ledger:",
                         id_str,
                         err->m_message);
            return operational_error{"Failed to publish voucher to ledger: "
                                     + err->m_message};
        }
        m_log->info("Voucher published to ledger:", id_str, "status ISSUED");

        return issue_response{std::move(voucher)};
    }

    auto voucher_service::issue(const issue_request& request)
        -> issue_result {
        return issue(request, unix_time_now());
    }

    auto voucher_service::query_status(const voucher_id_t& voucher_id)
        -> std::variant<std::optional<voucher_status>, operational_error> {
        const auto id_str = format_voucher_id(voucher_id);
        m_log->debug("Querying voucher status:", id_str);

        auto res = m_ledger->query_status(voucher_id);
        if(std::holds_alternative<port_error>(res)) {
            const auto& msg = std::get<port_error>(res).m_message;
            m_log->error("Failed to query voucher status:", id_str, msg);
            return operational_error{"Failed to query voucher status: " + msg};
        }

        const auto& status = std::get<std::optional<voucher_status>>(res);
        if(status.has_value()) {
            m_log->debug("Voucher status found:", id_str, to_string(*status));
        } else {
            m_log->debug("Voucher not found in ledger:", id_str);
        }
        return status;
    }

    auto voucher_service::refresh_stale_statuses(
        std::vector<backup::stored_voucher>& vouchers,
        int64_t stale_seconds,
        int64_t now) -> std::variant<size_t, operational_error> {
        size_t refreshed{0};
        for(auto& v : vouchers) {
            if(!v.is_status_stale(stale_seconds, now)) {
                continue;
            }
            auto res = query_status(v.voucher_id());
            if(std::holds_alternative<operational_error>(res)) {
                return std::get<operational_error>(res);
            }
            const auto& status = std::get<std::optional<voucher_status>>(res);
            if(!status.has_value()) {
                continue;
            }
            v.update_status(status.value(), now);
            refreshed++;
        }
        m_log->debug("Refreshed", refreshed, "stale voucher status(es)");
        return refreshed;
    }

    auto voucher_service::refresh_stale_statuses(
        std::vector<backup::stored_voucher>& vouchers,
        const config::options& opts)
        -> std::variant<size_t, operational_error> {
        return refresh_stale_statuses(vouchers,
                                      opts.m_status_stale_seconds,
                                      unix_time_now());
    }

    auto voucher_service::update_status(const voucher_id_t& voucher_id,
                                        voucher_status status)
        -> std::optional<operational_error> {
        const auto id_str = format_voucher_id(voucher_id);
        m_log->info("Updating voucher status:", id_str, to_string(status));

        auto err = m_ledger->update_status(voucher_id, status);
        if(err.has_value()) {
            m_log->error("Failed to update voucher status:",
                         id_str,
                         to_string(status),
                         err->m_message);
            return operational_error{"Failed to update voucher status: "
                                     + err->m_message};
        }

        m_log->info("Voucher status updated successfully:",
                    id_str,
                    to_string(status));
        return std::nullopt;
    }

    auto voucher_service::backup(const std::vector<signed_voucher>& vouchers,
                                 const std::string& user_key)
        -> std::optional<service_error> {
        if(is_blank(user_key)) {
            return precondition_error{backup::blank_user_key_error};
        }

        m_log->info("Backing up", vouchers.size(), "voucher(s)");
        if(vouchers.empty()) {
            m_log->debug("No vouchers to backup, skipping");
            return std::nullopt;
        }

        auto err = m_store->backup(vouchers, user_key);
        if(err.has_value()) {
            m_log->error("Failed to backup",
                         vouchers.size(),
                         "voucher(s):",
                         err->m_message);
            return operational_error{"Failed to backup vouchers: "
                                     + err->m_message};
        }

        m_log->info("Successfully backed up", vouchers.size(), "voucher(s)");
        return std::nullopt;
    }

    auto voucher_service::restore(const std::string& user_key)
        -> std::variant<std::vector<signed_voucher>,
                        precondition_error,
                        operational_error> {
        if(is_blank(user_key)) {
            return precondition_error{backup::blank_user_key_error};
        }

        m_log->info("Restoring vouchers from backup");

        auto res = m_store->restore(user_key);
        if(std::holds_alternative<port_error>(res)) {
            const auto& msg = std::get<port_error>(res).m_message;
            m_log->error("Failed to restore vouchers:", msg);
            return operational_error{"Failed to restore vouchers: " + msg};
        }

        auto& restored = std::get<std::vector<signed_voucher>>(res);
        m_log->info("Successfully restored", restored.size(), "voucher(s)");
        return std::move(restored);
    }

    auto voucher_service::exists(const voucher_id_t& voucher_id)
        -> std::variant<bool, operational_error> {
        auto res = m_ledger->exists(voucher_id);
        if(std::holds_alternative<port_error>(res)) {
            const auto& msg = std::get<port_error>(res).m_message;
            m_log->error("Failed to check voucher existence:",
                         format_voucher_id(voucher_id),
                         msg);
            return operational_error{"Failed to check voucher existence: "
                                     + msg};
        }
        return std::get<bool>(res);
    }

    auto voucher_service::generate_payment_request(
        const merchant::payment_request_params& params)
        -> std::variant<merchant::payment_request,
                        precondition_error,
                        operational_error> {
        m_log->info("Generating payment request: issuer",
                    params.m_issuer_id,
                    "amount",
                    params.m_amount.value_or(0),
                    "unit",
                    params.m_unit.value_or(""));

        auto res = merchant::generate_payment_request(params, *m_rng);
        if(const auto* req = std::get_if<merchant::payment_request>(&res)) {
            m_log->info("Generated payment request:",
                        req->m_payment_id.value_or(""),
                        "with",
                        req->m_transports.size(),
                        "transport(s)");
        }
        return res;
    }

    auto voucher_service::issuer_pubkey() const -> std::optional<pubkey_t> {
        return m_engine->derive_pubkey(m_issuer_key);
    }
}
