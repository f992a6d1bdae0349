// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef EVOUCHER_SRC_VOUCHER_SECRET_H_
#define EVOUCHER_SRC_VOUCHER_SECRET_H_

#include "error.hpp"
#include "voucher_id.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace evoucher {
    /// How the issuer backs the value of a voucher.
    enum class backing_strategy : uint8_t {
        /// Fixed face value; the voucher cannot be split.
        fixed,
        /// Splittable into coarse denominations.
        minimal,
        /// Splittable into fine-grained amounts according to the issuance
        /// ratio.
        proportional
    };

    /// Returns "FIXED", "MINIMAL" or "PROPORTIONAL".
    auto to_string(backing_strategy strategy) -> std::string;

    /// Parses an upper-case backing strategy name.
    /// \return the strategy, or std::nullopt if the name is not recognised.
    auto parse_backing_strategy(const std::string& name)
        -> std::optional<backing_strategy>;

    /// Indicates whether vouchers under this strategy can be split.
    /// \return true for every strategy except FIXED.
    auto is_splittable(backing_strategy strategy) -> bool;

    /// Indicates whether vouchers under this strategy split into arbitrary
    /// amounts.
    /// \return true only for PROPORTIONAL.
    auto has_fine_grained_splits(backing_strategy strategy) -> bool;

    /// \brief Fields of a voucher before validation.
    ///
    /// Passed to \ref voucher_secret::create, which checks every invariant.
    struct voucher_terms {
        /// Unique voucher identifier.
        voucher_id_t m_voucher_id{};
        /// Merchant that issued the voucher and alone may redeem it.
        std::string m_issuer_id;
        /// Currency or unit of account, e.g. "sat".
        std::string m_unit;
        /// Face value in the smallest denomination of the unit.
        int64_t m_face_value{};
        /// Absolute expiry time in Unix seconds, if any.
        std::optional<int64_t> m_expires_at;
        /// Free-form note, if any.
        std::optional<std::string> m_memo;
        /// How the voucher is backed.
        backing_strategy m_backing_strategy{backing_strategy::fixed};
        /// Ratio of backing to face value, used when PROPORTIONAL.
        double m_issuance_ratio{1.0};
        /// Number of decimal places of the face value.
        int32_t m_face_decimals{0};
        /// Merchant metadata as a JSON object text, if any.
        std::optional<std::string> m_merchant_metadata;
    };

    /// \brief The signed terms of a voucher.
    ///
    /// Immutable once created. Every field is covered by the issuer
    /// signature through the canonical encoding.
    class voucher_secret {
      public:
        /// Validates the terms and builds a secret from them. A blank memo
        /// is stored as absent. Metadata is re-serialized in canonical form
        /// and an empty object is stored as absent.
        /// \param terms voucher fields.
        /// \return the secret, or the first violated precondition.
        static auto create(voucher_terms terms)
            -> std::variant<voucher_secret, precondition_error>;

        [[nodiscard]] auto voucher_id() const -> const voucher_id_t&;
        [[nodiscard]] auto issuer_id() const -> const std::string&;
        [[nodiscard]] auto unit() const -> const std::string&;
        [[nodiscard]] auto face_value() const -> int64_t;
        [[nodiscard]] auto expires_at() const -> const std::optional<int64_t>&;
        [[nodiscard]] auto memo() const -> const std::optional<std::string>&;
        [[nodiscard]] auto get_backing_strategy() const -> backing_strategy;
        [[nodiscard]] auto issuance_ratio() const -> double;
        [[nodiscard]] auto face_decimals() const -> int32_t;
        [[nodiscard]] auto merchant_metadata() const
            -> const std::optional<std::string>&;

        /// Returns the validated fields.
        [[nodiscard]] auto terms() const -> const voucher_terms&;

        auto operator==(const voucher_secret& rhs) const -> bool;
        auto operator!=(const voucher_secret& rhs) const -> bool;

      private:
        explicit voucher_secret(voucher_terms terms);

        voucher_terms m_terms;
    };
}

#endif // EVOUCHER_SRC_VOUCHER_SECRET_H_
