// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "cbor.hpp"

#include <algorithm>
#include <array>
#include <cstring>
#include <limits>

namespace evoucher::cbor {
    namespace {
        constexpr uint8_t max_direct_arg = 23;
        constexpr uint8_t arg_1_byte = 24;
        constexpr uint8_t arg_2_bytes = 25;
        constexpr uint8_t arg_4_bytes = 26;
        constexpr uint8_t arg_8_bytes = 27;

        constexpr uint8_t simple_false = 0xf4;
        constexpr uint8_t simple_true = 0xf5;
        constexpr uint8_t simple_null = 0xf6;
        constexpr uint8_t float_64 = 0xfb;

        constexpr auto major_shift = 5U;

        /// Writes the lowest N bytes of val most significant first.
        template<size_t N>
        void write_be(serializer& ser, uint64_t val) {
            auto out = std::array<uint8_t, N>();
            for(size_t i = 0; i < N; i++) {
                out[N - 1 - i] = static_cast<uint8_t>(val >> (i * 8U));
            }
            ser.write(out.data(), out.size());
        }

        auto initial_byte(major_type type, uint8_t info) -> uint8_t {
            return static_cast<uint8_t>(
                (static_cast<uint8_t>(type) << major_shift) | info);
        }
    }

    writer::writer(serializer& ser) : m_ser(ser) {}

    void writer::write_head(major_type type, uint64_t arg) {
        if(arg <= max_direct_arg) {
            const auto b = initial_byte(type, static_cast<uint8_t>(arg));
            m_ser.write(&b, sizeof(b));
        } else if(arg <= std::numeric_limits<uint8_t>::max()) {
            const auto b = initial_byte(type, arg_1_byte);
            m_ser.write(&b, sizeof(b));
            write_be<1>(m_ser, arg);
        } else if(arg <= std::numeric_limits<uint16_t>::max()) {
            const auto b = initial_byte(type, arg_2_bytes);
            m_ser.write(&b, sizeof(b));
            write_be<2>(m_ser, arg);
        } else if(arg <= std::numeric_limits<uint32_t>::max()) {
            const auto b = initial_byte(type, arg_4_bytes);
            m_ser.write(&b, sizeof(b));
            write_be<4>(m_ser, arg);
        } else {
            const auto b = initial_byte(type, arg_8_bytes);
            m_ser.write(&b, sizeof(b));
            write_be<8>(m_ser, arg);
        }
    }

    void writer::write_uint(uint64_t val) {
        write_head(major_type::unsigned_int, val);
    }

    void writer::write_int(int64_t val) {
        if(val >= 0) {
            write_head(major_type::unsigned_int, static_cast<uint64_t>(val));
            return;
        }
        // -1 - n without overflowing for the smallest int64_t.
        const auto arg = static_cast<uint64_t>(-(val + 1));
        write_head(major_type::negative_int, arg);
    }

    void writer::write_text(const std::string& val) {
        write_head(major_type::text_string, val.size());
        m_ser.write(val.data(), val.size());
    }

    void writer::write_bytes(const buffer& val) {
        write_head(major_type::byte_string, val.size());
        m_ser.write(val.data(), val.size());
    }

    void writer::write_null() {
        m_ser.write(&simple_null, sizeof(simple_null));
    }

    void writer::write_bool(bool val) {
        const auto b = val ? simple_true : simple_false;
        m_ser.write(&b, sizeof(b));
    }

    void writer::write_double(double val) {
        static_assert(sizeof(double) == sizeof(uint64_t));
        uint64_t bits{};
        std::memcpy(&bits, &val, sizeof(bits));
        m_ser.write(&float_64, sizeof(float_64));
        write_be<sizeof(bits)>(m_ser, bits);
    }

    void writer::write_array_header(uint64_t count) {
        write_head(major_type::array, count);
    }

    void writer::write_map_header(uint64_t count) {
        write_head(major_type::map, count);
    }

    void writer::write_raw(const buffer& encoded) {
        m_ser.write(encoded.data(), encoded.size());
    }

    auto canonical_map::size() const -> size_t {
        return m_entries.size();
    }

    void canonical_map::write_to(writer& out) const {
        auto sorted = std::vector<const std::pair<buffer, buffer>*>();
        sorted.reserve(m_entries.size());
        for(const auto& e : m_entries) {
            sorted.push_back(&e);
        }
        std::sort(sorted.begin(), sorted.end(), [](auto* lhs, auto* rhs) {
            const auto* l = lhs->first.c_ptr();
            const auto* r = rhs->first.c_ptr();
            return std::lexicographical_compare(l,
                                                l + lhs->first.size(),
                                                r,
                                                r + rhs->first.size());
        });

        out.write_map_header(sorted.size());
        for(const auto* e : sorted) {
            out.write_raw(e->first);
            out.write_raw(e->second);
        }
    }
}
