// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "validation.hpp"

#include "util/common/clock.hpp"
#include "util/common/strings.hpp"

namespace evoucher::validation {
    result::result(bool valid, std::vector<std::string> errors)
        : m_valid(valid),
          m_errors(std::move(errors)) {}

    auto result::success() -> result {
        return result(true, {});
    }

    auto result::failure(std::string error) -> result {
        return result(false, {std::move(error)});
    }

    auto result::failure(std::vector<std::string> errors) -> result {
        if(errors.empty()) {
            errors.emplace_back("Validation failed");
        }
        return result(false, std::move(errors));
    }

    auto result::is_valid() const -> bool {
        return m_valid;
    }

    auto result::errors() const -> const std::vector<std::string>& {
        return m_errors;
    }

    auto result::error_message() const -> std::string {
        return join(m_errors, "; ");
    }

    auto result::to_string() const -> std::string {
        if(m_valid) {
            return "result{valid=true}";
        }
        return "result{valid=false, errors=[" + join(m_errors, ", ") + "]}";
    }

    auto result::operator==(const result& rhs) const -> bool {
        return m_valid == rhs.m_valid && m_errors == rhs.m_errors;
    }

    auto validate(const signed_voucher& voucher,
                  const signature_engine& engine,
                  int64_t now) -> result {
        auto errors = std::vector<std::string>();
        if(!voucher.verify(engine)) {
            errors.emplace_back(invalid_signature_error);
        }
        if(voucher.is_expired(now)) {
            errors.emplace_back(expired_error);
        }
        if(errors.empty()) {
            return result::success();
        }
        return result::failure(std::move(errors));
    }

    auto validate(const signed_voucher& voucher,
                  const signature_engine& engine) -> result {
        return validate(voucher, engine, unix_time_now());
    }

    auto validate_with_issuer(const signed_voucher& voucher,
                              const signature_engine& engine,
                              const std::string& expected_issuer_id,
                              int64_t now) -> result {
        auto standard = validate(voucher, engine, now);
        if(!standard.is_valid()) {
            return standard;
        }
        if(voucher.issuer_id() != expected_issuer_id) {
            return result::failure(
                issuer_mismatch_error(voucher.issuer_id(),
                                      expected_issuer_id));
        }
        return result::success();
    }

    auto validate_with_issuer(const signed_voucher& voucher,
                              const signature_engine& engine,
                              const std::string& expected_issuer_id)
        -> result {
        return validate_with_issuer(voucher,
                                    engine,
                                    expected_issuer_id,
                                    unix_time_now());
    }

    auto validate_signature_only(const signed_voucher& voucher,
                                 const signature_engine& engine) -> result {
        if(voucher.verify(engine)) {
            return result::success();
        }
        return result::failure(invalid_signature_error);
    }

    auto validate_expiry_only(const signed_voucher& voucher, int64_t now)
        -> result {
        if(voucher.is_expired(now)) {
            return result::failure(expired_error);
        }
        return result::success();
    }

    auto validate_expiry_only(const signed_voucher& voucher) -> result {
        return validate_expiry_only(voucher, unix_time_now());
    }

    auto is_valid(const signed_voucher& voucher,
                  const signature_engine& engine,
                  int64_t now) -> bool {
        return validate(voucher, engine, now).is_valid();
    }

    auto is_valid(const signed_voucher& voucher,
                  const signature_engine& engine) -> bool {
        return is_valid(voucher, engine, unix_time_now());
    }

    auto issuer_mismatch_error(const std::string& actual,
                               const std::string& expected) -> std::string {
        return "Voucher was issued by '" + actual + "' but expected issuer is '"
             + expected + "'";
    }
}
