// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "strings.hpp"

#include <algorithm>
#include <cctype>

namespace evoucher {
    auto is_blank(const std::string& str) -> bool {
        return std::all_of(str.begin(), str.end(), [](unsigned char c) {
            return std::isspace(c) != 0;
        });
    }

    auto join(const std::vector<std::string>& parts,
              const std::string& separator) -> std::string {
        auto ret = std::string();
        for(size_t i = 0; i < parts.size(); i++) {
            if(i > 0) {
                ret += separator;
            }
            ret += parts[i];
        }
        return ret;
    }
}
