// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/** \file cbor.hpp
 *  Writer for the deterministically encoded subset of CBOR (RFC 8949,
 *  section 4.2.1) used as signature input.
 */

#ifndef EVOUCHER_SRC_UTIL_SERIALIZATION_CBOR_H_
#define EVOUCHER_SRC_UTIL_SERIALIZATION_CBOR_H_

#include "buffer_serializer.hpp"
#include "serializer.hpp"
#include "util/common/buffer.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace evoucher::cbor {
    /// CBOR major types, stored in the top three bits of the initial byte.
    enum class major_type : uint8_t {
        unsigned_int = 0,
        negative_int = 1,
        byte_string = 2,
        text_string = 3,
        array = 4,
        map = 5,
        tag = 6,
        simple = 7
    };

    /// Emits CBOR data items to a \ref serializer. Every integer argument
    /// uses the shortest of the 0, 1, 2, 4 or 8 byte forms, in network byte
    /// order.
    class writer {
      public:
        /// Constructor.
        /// \param ser serializer to write encoded items to.
        explicit writer(serializer& ser);

        /// Writes an unsigned integer.
        void write_uint(uint64_t val);

        /// Writes a signed integer as major type 0 or 1.
        void write_int(int64_t val);

        /// Writes a UTF-8 text string.
        void write_text(const std::string& val);

        /// Writes a byte string.
        void write_bytes(const buffer& val);

        /// Writes the simple value null (0xf6).
        void write_null();

        /// Writes the simple value true (0xf5) or false (0xf4).
        void write_bool(bool val);

        /// Writes a double in its 8-byte form (0xfb), whatever its value.
        void write_double(double val);

        /// Writes the head of a definite-length array.
        /// \param count number of items that follow.
        void write_array_header(uint64_t count);

        /// Writes the head of a definite-length map.
        /// \param count number of key/value pairs that follow.
        void write_map_header(uint64_t count);

        /// Copies already encoded items verbatim.
        void write_raw(const buffer& encoded);

      private:
        void write_head(major_type type, uint64_t arg);

        serializer& m_ser;
    };

    /// Collects map entries and emits them in deterministic order: keys
    /// sorted by the bytewise lexicographic order of their encoded form.
    class canonical_map {
      public:
        /// Adds an entry with a text key.
        /// \param key map key.
        /// \param write_value callable receiving a \ref writer that must
        ///                    write exactly one data item.
        /// \return false if the key is already present.
        template<typename F>
        auto add(const std::string& key, F&& write_value) -> bool {
            auto encoded_key = buffer();
            {
                auto ser = buffer_serializer(encoded_key);
                auto w = writer(ser);
                w.write_text(key);
            }
            for(const auto& e : m_entries) {
                if(e.first == encoded_key) {
                    return false;
                }
            }
            auto encoded_value = buffer();
            {
                auto ser = buffer_serializer(encoded_value);
                auto w = writer(ser);
                write_value(w);
            }
            m_entries.emplace_back(std::move(encoded_key),
                                   std::move(encoded_value));
            return true;
        }

        /// Returns the number of entries added so far.
        [[nodiscard]] auto size() const -> size_t;

        /// Writes the map header followed by the sorted entries.
        /// \param out writer to emit the map to.
        void write_to(writer& out) const;

      private:
        std::vector<std::pair<buffer, buffer>> m_entries;
    };
}

#endif // EVOUCHER_SRC_UTIL_SERIALIZATION_CBOR_H_
