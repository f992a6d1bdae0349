// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "buffer.hpp"

#include <cstring>

namespace evoucher {
    namespace {
        constexpr auto hex_digits = "0123456789abcdef";

        auto hex_value(char c) -> std::optional<unsigned int> {
            if(c >= '0' && c <= '9') {
                return static_cast<unsigned int>(c - '0');
            }
            if(c >= 'a' && c <= 'f') {
                return static_cast<unsigned int>(c - 'a' + 10);
            }
            if(c >= 'A' && c <= 'F') {
                return static_cast<unsigned int>(c - 'A' + 10);
            }
            return std::nullopt;
        }
    }

    void buffer::clear() {
        m_data.clear();
    }

    void buffer::append(const void* data, size_t len) {
        const auto orig_size = m_data.size();
        m_data.resize(orig_size + len);
        if(len > 0) {
            std::memcpy(&m_data[orig_size], data, len);
        }
    }

    auto buffer::size() const -> size_t {
        return m_data.size();
    }

    auto buffer::data() -> void* {
        return m_data.data();
    }

    auto buffer::data() const -> const void* {
        return m_data.data();
    }

    auto buffer::data_at(size_t offset) -> void* {
        return &m_data[offset];
    }

    auto buffer::data_at(size_t offset) const -> const void* {
        return &m_data[offset];
    }

    auto buffer::operator==(const buffer& other) const -> bool {
        return m_data == other.m_data;
    }

    auto buffer::operator!=(const buffer& other) const -> bool {
        return !(*this == other);
    }

    void buffer::extend(size_t len) {
        m_data.resize(m_data.size() + len);
    }

    auto buffer::c_ptr() const -> const unsigned char* {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        return reinterpret_cast<const unsigned char*>(m_data.data());
    }

    auto buffer::c_str() const -> const char* {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        return reinterpret_cast<const char*>(m_data.data());
    }

    auto buffer::to_hex() const -> std::string {
        auto ret = std::string();
        ret.reserve(m_data.size() * 2);
        for(const auto& byte : m_data) {
            const auto v = std::to_integer<unsigned int>(byte);
            ret.push_back(hex_digits[v >> 4U]);
            ret.push_back(hex_digits[v & 0x0fU]);
        }
        return ret;
    }

    auto buffer::from_hex(const std::string& hex) -> std::optional<buffer> {
        constexpr auto max_size = 102400;
        if(hex.empty() || ((hex.size() % 2) != 0) || (hex.size() > max_size)) {
            return std::nullopt;
        }

        auto ret = evoucher::buffer();
        ret.m_data.reserve(hex.size() / 2);

        for(size_t i = 0; i < hex.size(); i += 2) {
            const auto hi = hex_value(hex[i]);
            const auto lo = hex_value(hex[i + 1]);
            if(!hi.has_value() || !lo.has_value()) {
                return std::nullopt;
            }
            ret.m_data.push_back(static_cast<std::byte>((*hi << 4U) | *lo));
        }

        return ret;
    }
}
