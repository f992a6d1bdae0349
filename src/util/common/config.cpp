// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
//               2022 MITRE Corporation
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "config.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <memory>
#include <secp256k1.h>
#include <sstream>

namespace evoucher::config {
    namespace {
        using secp256k1_context_destroy_type = void (*)(secp256k1_context*);

        auto make_secp_context()
            -> std::unique_ptr<secp256k1_context,
                               secp256k1_context_destroy_type> {
            return {secp256k1_context_create(SECP256K1_CONTEXT_NONE),
                    &secp256k1_context_destroy};
        }

        auto read_key_options(options& opts, const parser& cfg)
            -> std::optional<std::string> {
            const auto priv_str = cfg.get_string(issuer_private_key_key);
            if(!priv_str.has_value()) {
                return std::string("No issuer private key specified (")
                     + issuer_private_key_key + ")";
            }
            const auto priv = array_from_hex<privkey_len>(priv_str.value());
            if(!priv.has_value()) {
                return std::string("Issuer private key must be ")
                     + std::to_string(privkey_len * 2) + " hex digits ("
                     + issuer_private_key_key + ")";
            }
            opts.m_issuer_private_key = priv.value();

            const auto pub_str = cfg.get_string(issuer_public_key_key);
            if(pub_str.has_value()) {
                const auto pub = array_from_hex<pubkey_len>(pub_str.value());
                if(!pub.has_value()) {
                    return std::string("Issuer public key must be ")
                         + std::to_string(pubkey_len * 2) + " hex digits ("
                         + issuer_public_key_key + ")";
                }
                opts.m_issuer_public_key = pub.value();
                return std::nullopt;
            }

            auto secp = make_secp_context();
            const auto derived
                = pubkey_from_privkey(opts.m_issuer_private_key, secp.get());
            if(!derived.has_value()) {
                return std::string("Issuer private key is not a valid "
                                   "secp256k1 secret key (")
                     + issuer_private_key_key + ")";
            }
            opts.m_issuer_public_key = derived.value();
            return std::nullopt;
        }

        void read_policy_options(options& opts, const parser& cfg) {
            const auto max_amount = cfg.get_ulong(max_voucher_amount_key);
            if(max_amount.has_value()) {
                opts.m_max_voucher_amount
                    = static_cast<int64_t>(max_amount.value());
            }
            const auto max_days = cfg.get_ulong(max_expiry_days_key);
            if(max_days.has_value()) {
                opts.m_max_expiry_days = static_cast<int64_t>(max_days.value());
            }
            const auto stale = cfg.get_ulong(status_stale_seconds_key);
            if(stale.has_value()) {
                opts.m_status_stale_seconds
                    = static_cast<int64_t>(stale.value());
            }
            opts.m_loglevel
                = cfg.get_loglevel(loglevel_key).value_or(defaults::log_level);
        }
    }

    auto read_options(std::istream& stream)
        -> std::variant<options, std::string> {
        auto opts = options{};
        auto cfg = parser(stream);

        auto err = read_key_options(opts, cfg);
        if(err.has_value()) {
            return err.value();
        }

        read_policy_options(opts, cfg);

        return opts;
    }

    auto read_options(const std::string& config_file)
        -> std::variant<options, std::string> {
        std::ifstream file(config_file);
        if(!file.good()) {
            return "Unable to open config file " + config_file;
        }
        return read_options(file);
    }

    auto load_options(const std::string& config_file)
        -> std::variant<options, std::string> {
        auto opt = read_options(config_file);
        if(std::holds_alternative<options>(opt)) {
            auto res = check_options(std::get<options>(opt));
            if(res) {
                return *res;
            }
        }
        return opt;
    }

    auto check_options(const options& opts) -> std::optional<std::string> {
        if(opts.m_max_voucher_amount <= 0) {
            return "Max voucher amount must be positive";
        }
        if(opts.m_max_expiry_days <= 0) {
            return "Max expiry days must be positive";
        }
        if(opts.m_status_stale_seconds <= 0) {
            return "Status stale threshold must be positive";
        }

        auto secp = make_secp_context();
        const auto derived
            = pubkey_from_privkey(opts.m_issuer_private_key, secp.get());
        if(!derived.has_value()) {
            return "Issuer private key is not a valid secp256k1 secret key";
        }
        if(derived.value() != opts.m_issuer_public_key) {
            return "Issuer public key does not match the issuer private key";
        }

        return std::nullopt;
    }

    parser::parser(std::istream& stream) {
        std::string line;
        while(std::getline(stream, line)) {
            if(line.empty() || line[0] == '#') {
                continue;
            }
            std::istringstream line_stream(line);
            std::string key;
            if(std::getline(line_stream, key, '=')) {
                std::string value;
                if(std::getline(line_stream, value) && !value.empty()) {
                    m_options.emplace(key, parse_value(value));
                }
            }
        }
    }

    auto parser::get_string(const std::string& key) const
        -> std::optional<std::string> {
        return get_val<std::string>(key);
    }

    auto parser::get_ulong(const std::string& key) const
        -> std::optional<size_t> {
        return get_val<size_t>(key);
    }

    auto parser::get_loglevel(const std::string& key) const
        -> std::optional<logging::log_level> {
        const auto val_str = get_string(key);
        if(!val_str.has_value()) {
            return std::nullopt;
        }
        return logging::parse_loglevel(val_str.value());
    }

    auto parser::find_or_env(const std::string& key) const
        -> std::optional<value_t> {
        auto upper_key = key;
        std::transform(upper_key.begin(),
                       upper_key.end(),
                       upper_key.begin(),
                       [](unsigned char c) {
                           return std::toupper(c);
                       });
        if(const auto* env_v = std::getenv(upper_key.c_str())) {
            auto value = std::string(env_v);
            if(!value.empty()) {
                return parse_value(value);
            }
        }

        auto it = m_options.find(key);
        if(it != m_options.end()) {
            return it->second;
        }

        return std::nullopt;
    }

    auto parser::parse_value(const std::string& value) -> value_t {
        if(value.size() >= 2 && value.front() == '\"'
           && value.back() == '\"') {
            return value.substr(1, value.size() - 2);
        }

        // Bare values that are not numbers are kept as strings.
        const auto* begin = value.c_str();
        char* end{};
        errno = 0;
        if(value.find('.') == std::string::npos) {
            if(value.front() == '-') {
                return value;
            }
            const auto as_int = std::strtoull(begin, &end, 10);
            if(errno != 0 || end != begin + value.size()) {
                return value;
            }
            return static_cast<size_t>(as_int);
        }
        const auto as_dbl = std::strtod(begin, &end);
        if(errno != 0 || end != begin + value.size()) {
            return value;
        }
        return as_dbl;
    }
}
