// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "random_source.hpp"

namespace evoucher {
    random_source::random_source(const std::string& source_file)
        : m_source(source_file, std::ios::in | std::ios::binary) {}

    auto random_source::good() const -> bool {
        std::unique_lock<std::mutex> l(m_mut);
        return m_source.good();
    }

    auto random_source::read(unsigned char* dest, size_t len) -> bool {
        std::unique_lock<std::mutex> l(m_mut);
        if(!m_source.good()) {
            return false;
        }
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        m_source.read(reinterpret_cast<char*>(dest),
                      static_cast<std::streamsize>(len));
        return m_source.gcount() == static_cast<std::streamsize>(len);
    }
}
