// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "clock.hpp"

#include <chrono>

namespace evoucher {
    auto unix_time_now() -> int64_t {
        const auto now = std::chrono::system_clock::now();
        return std::chrono::duration_cast<std::chrono::seconds>(
                   now.time_since_epoch())
            .count();
    }
}
