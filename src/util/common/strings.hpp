// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef EVOUCHER_SRC_UTIL_COMMON_STRINGS_H_
#define EVOUCHER_SRC_UTIL_COMMON_STRINGS_H_

#include <string>
#include <vector>

namespace evoucher {
    /// Checks whether a string is empty or holds only whitespace.
    /// \param str string to check.
    /// \return true if the string has no printable content.
    auto is_blank(const std::string& str) -> bool;

    /// Concatenates strings, placing a separator between neighbours.
    /// \param parts strings to join, in order.
    /// \param separator text placed between consecutive parts.
    /// \return the joined string, empty if parts is empty.
    auto join(const std::vector<std::string>& parts,
              const std::string& separator) -> std::string;
}

#endif // EVOUCHER_SRC_UTIL_COMMON_STRINGS_H_
