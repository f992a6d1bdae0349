// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
//               2022 MITRE Corporation
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * \file config.hpp
 * Tools for reading options from a configuration file and building the
 * issuer parameter set used by the voucher services.
 */

#ifndef EVOUCHER_SRC_UTIL_COMMON_CONFIG_H_
#define EVOUCHER_SRC_UTIL_COMMON_CONFIG_H_

#include "keys.hpp"
#include "logging.hpp"

#include <cstdint>
#include <istream>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <variant>

namespace evoucher::config {
    /// Random source to use when generating nonces and identifiers.
    static constexpr const char* random_source{"/dev/urandom"};

    /// \brief Maximum bytes optimistically reserved at once during
    /// deserialization.
    /// A sender must send at least X bytes of information for us to allocate
    /// X+1MiB of memory.
    static constexpr uint64_t maximum_reservation
        = static_cast<uint64_t>(1024 * 1024); // 1MiB

    namespace defaults {
        static constexpr int64_t max_voucher_amount{
            std::numeric_limits<int64_t>::max()};
        static constexpr int64_t max_expiry_days{3650};
        static constexpr int64_t status_stale_seconds{300};

        static constexpr auto log_level = logging::log_level::warn;
    }

    static constexpr auto issuer_private_key_key = "issuer_private_key";
    static constexpr auto issuer_public_key_key = "issuer_public_key";
    static constexpr auto max_voucher_amount_key = "max_voucher_amount";
    static constexpr auto max_expiry_days_key = "max_expiry_days";
    static constexpr auto status_stale_seconds_key = "status_stale_seconds";
    static constexpr auto loglevel_key = "loglevel";

    /// Issuer configuration options.
    struct options {
        /// Private key the issuer signs vouchers with.
        privkey_t m_issuer_private_key{};
        /// X-only public key matching the issuer private key.
        pubkey_t m_issuer_public_key{};
        /// Largest face value the issuance policy accepts.
        int64_t m_max_voucher_amount{defaults::max_voucher_amount};
        /// Longest validity period, in days, the issuance policy accepts.
        int64_t m_max_expiry_days{defaults::max_expiry_days};
        /// Age in seconds after which a cached voucher status is stale.
        int64_t m_status_stale_seconds{defaults::status_stale_seconds};
        /// Log level for the voucher services.
        logging::log_level m_loglevel{defaults::log_level};
    };

    /// Read options from the given config file without checking invariants.
    /// \param config_file the path to the config file from which to load
    ///                    options.
    /// \return options struct with all required values, or string with error
    ///         message on failure.
    auto read_options(const std::string& config_file)
        -> std::variant<options, std::string>;

    /// Read options from the given stream without checking invariants.
    /// \param stream stream holding key=value lines.
    /// \return options struct with all required values, or string with error
    ///         message on failure.
    auto read_options(std::istream& stream)
        -> std::variant<options, std::string>;

    /// Loads options from the given config file and check for invariants.
    /// \param config_file the path to the config file from which load options.
    /// \return valid options struct, or string with error message on failure.
    auto load_options(const std::string& config_file)
        -> std::variant<options, std::string>;

    /// Checks a fully populated options struct for invariants.
    /// \param opts options struct to check.
    /// \return std::nullopt if the struct satisfies all invariants. Error
    ///         string otherwise.
    auto check_options(const options& opts) -> std::optional<std::string>;

    /// Reads configuration parameters line-by-line from a stream. Expects
    /// line-separated parameters with each line in the form key=value,
    /// where the key is a lower-case string that may contain numbers and
    /// symbols. Acceptable value types:
    /// - Strings: quoted with double quotes. Ex: some_string="hello"
    /// - Integers: standalone numbers. Ex: some_int=30
    /// - Doubles: a number with a decimal point. Ex: some_double=12.4
    /// - Log levels: in the form of a string. Must be one of the log levels
    ///   enumerated in logging.hpp, in upper-case. Ex: some_loglevel="TRACE"
    ///
    /// Every key can be overridden by an environment variable named after
    /// the upper-cased key.
    class parser {
      public:
        /// Constructor.
        /// \param stream the generic stream used to add config values.
        explicit parser(std::istream& stream);

        /// Returns the given key if its value is a string.
        /// \param key key to retrieve.
        /// \return value associated with the key or std::nullopt if the value
        ///         was not a string or does not exist.
        [[nodiscard]] auto get_string(const std::string& key) const
            -> std::optional<std::string>;

        /// Return the value for the given key if its value is a long.
        /// \param key key to retrieve.
        /// \return value associated with the key, or std::nullopt if the value
        ///         was not a long or doesn't exist.
        [[nodiscard]] auto get_ulong(const std::string& key) const
            -> std::optional<size_t>;

        /// Return the value for the given key if its value is a loglevel.
        /// \param key key to retrieve.
        /// \return value associated with the key, or std::nullopt if the value
        ///         was not a loglevel or does not exist.
        [[nodiscard]] auto get_loglevel(const std::string& key) const
            -> std::optional<logging::log_level>;

      private:
        using value_t = std::variant<std::string, size_t, double>;

        [[nodiscard]] auto find_or_env(const std::string& key) const
            -> std::optional<value_t>;

        template<typename T>
        [[nodiscard]] auto get_val(const std::string& key) const
            -> std::optional<T> {
            const auto it = find_or_env(key);
            if(it) {
                const auto* val = std::get_if<T>(&it.value());
                if(val != nullptr) {
                    return *val;
                }
            }
            return std::nullopt;
        }

        static auto parse_value(const std::string& value) -> value_t;

        std::map<std::string, value_t> m_options;
    };
}

#endif // EVOUCHER_SRC_UTIL_COMMON_CONFIG_H_
