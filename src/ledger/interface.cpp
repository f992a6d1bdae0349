// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "interface.hpp"

namespace evoucher::ledger {
    auto interface::exists(const voucher_id_t& voucher_id)
        -> std::variant<bool, port_error> {
        auto res = query_status(voucher_id);
        if(std::holds_alternative<port_error>(res)) {
            return std::get<port_error>(std::move(res));
        }
        return std::get<std::optional<voucher_status>>(res).has_value();
    }

    auto interface::query_voucher(const voucher_id_t& /* voucher_id */)
        -> voucher_result {
        return port_error{"query_voucher is not supported by this ledger"};
    }
}
