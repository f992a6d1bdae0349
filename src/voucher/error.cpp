// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "error.hpp"

namespace evoucher {
    auto precondition_error::operator==(const precondition_error& rhs) const
        -> bool {
        return m_message == rhs.m_message;
    }

    auto operational_error::operator==(const operational_error& rhs) const
        -> bool {
        return m_message == rhs.m_message;
    }

    auto port_error::operator==(const port_error& rhs) const -> bool {
        return m_message == rhs.m_message;
    }

    auto error_message(const service_error& err) -> const std::string& {
        if(const auto* pre = std::get_if<precondition_error>(&err)) {
            return pre->m_message;
        }
        return std::get<operational_error>(err).m_message;
    }
}
