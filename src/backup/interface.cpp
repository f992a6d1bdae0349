// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "interface.hpp"

namespace evoucher::backup {
    auto interface::has_backups(const std::string& user_key)
        -> std::variant<bool, port_error> {
        auto res = restore(user_key);
        if(std::holds_alternative<port_error>(res)) {
            return std::get<port_error>(std::move(res));
        }
        return !std::get<std::vector<signed_voucher>>(res).empty();
    }

    auto interface::delete_backups(const std::string& /* user_key */)
        -> std::optional<port_error> {
        return port_error{"delete_backups is not supported by this backup "
                          "store"};
    }
}
