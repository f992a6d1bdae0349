// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef EVOUCHER_SRC_UTIL_COMMON_CLOCK_H_
#define EVOUCHER_SRC_UTIL_COMMON_CLOCK_H_

#include <cstdint>

namespace evoucher {
    /// Number of seconds in one day.
    static constexpr int64_t seconds_per_day = 86400;

    /// Returns the current wall-clock time in whole seconds since the Unix
    /// epoch.
    auto unix_time_now() -> int64_t;
}

#endif // EVOUCHER_SRC_UTIL_COMMON_CLOCK_H_
