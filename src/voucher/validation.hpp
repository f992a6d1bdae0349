// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef EVOUCHER_SRC_VOUCHER_VALIDATION_H_
#define EVOUCHER_SRC_VOUCHER_VALIDATION_H_

#include "signature.hpp"
#include "signed_voucher.hpp"

#include <string>
#include <vector>

namespace evoucher::validation {
    /// Error reported when the issuer signature does not verify.
    static constexpr auto invalid_signature_error = "Invalid issuer signature";
    /// Error reported when the voucher is past its expiry.
    static constexpr auto expired_error = "Voucher has expired";

    /// \brief Outcome of a validation call.
    ///
    /// Invalid results always carry at least one reason; valid results
    /// carry none.
    class result {
      public:
        /// Returns a passing result.
        static auto success() -> result;

        /// Returns a failing result with a single reason.
        static auto failure(std::string error) -> result;

        /// Returns a failing result with every given reason, in order. An
        /// empty list is replaced with a generic reason so the result still
        /// explains itself.
        static auto failure(std::vector<std::string> errors) -> result;

        /// Indicates whether validation passed.
        [[nodiscard]] auto is_valid() const -> bool;

        /// Returns the failure reasons in the order they were found.
        [[nodiscard]] auto errors() const -> const std::vector<std::string>&;

        /// Returns all failure reasons joined by "; ".
        [[nodiscard]] auto error_message() const -> std::string;

        [[nodiscard]] auto to_string() const -> std::string;

        auto operator==(const result& rhs) const -> bool;

      private:
        result(bool valid, std::vector<std::string> errors);

        bool m_valid;
        std::vector<std::string> m_errors;
    };

    /// \brief Runs the signature and expiry checks.
    ///
    /// Every failing check contributes its own reason; the checks do not
    /// short-circuit.
    /// \param voucher voucher to check.
    /// \param engine signature engine used to verify the issuer signature.
    /// \param now current time in Unix seconds.
    /// \return validation outcome.
    auto validate(const signed_voucher& voucher,
                  const signature_engine& engine,
                  int64_t now) -> result;

    /// \see validate(const signed_voucher&, const signature_engine&, int64_t)
    ///      at the current wall-clock time.
    auto validate(const signed_voucher& voucher,
                  const signature_engine& engine) -> result;

    /// Runs \ref validate and, only if it passes, checks that the voucher
    /// was issued by the expected issuer.
    /// \param voucher voucher to check.
    /// \param engine signature engine.
    /// \param expected_issuer_id merchant expected to have issued the
    ///                           voucher.
    /// \param now current time in Unix seconds.
    /// \return the failed \ref validate result, an issuer mismatch failure,
    ///         or success.
    auto validate_with_issuer(const signed_voucher& voucher,
                              const signature_engine& engine,
                              const std::string& expected_issuer_id,
                              int64_t now) -> result;

    auto validate_with_issuer(const signed_voucher& voucher,
                              const signature_engine& engine,
                              const std::string& expected_issuer_id)
        -> result;

    /// Checks only the issuer signature, ignoring expiry.
    auto validate_signature_only(const signed_voucher& voucher,
                                 const signature_engine& engine) -> result;

    /// Checks only the expiry, ignoring the signature.
    auto validate_expiry_only(const signed_voucher& voucher, int64_t now)
        -> result;

    auto validate_expiry_only(const signed_voucher& voucher) -> result;

    /// Returns validate(voucher, engine, now).is_valid().
    auto is_valid(const signed_voucher& voucher,
                  const signature_engine& engine,
                  int64_t now) -> bool;

    auto is_valid(const signed_voucher& voucher,
                  const signature_engine& engine) -> bool;

    /// Formats the issuer mismatch reason.
    auto issuer_mismatch_error(const std::string& actual,
                               const std::string& expected) -> std::string;
}

#endif // EVOUCHER_SRC_VOUCHER_VALIDATION_H_
