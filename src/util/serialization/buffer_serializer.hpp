// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef EVOUCHER_SRC_UTIL_SERIALIZATION_BUFFER_SERIALIZER_H_
#define EVOUCHER_SRC_UTIL_SERIALIZATION_BUFFER_SERIALIZER_H_

#include "serializer.hpp"
#include "util/common/buffer.hpp"

namespace evoucher {
    /// \brief Serializer implementation for \ref buffer.
    class buffer_serializer final : public evoucher::serializer {
      public:
        /// Constructor.
        /// \param pkt buffer to serialize into or out of.
        explicit buffer_serializer(evoucher::buffer& pkt);

        /// Indicates whether the last serialization operation succeeded.
        /// A failed read leaves the serializer invalid until \ref reset.
        /// \return true if no read has run past the end of the buffer.
        explicit operator bool() const final;

        /// Resets the cursor to the start of the buffer.
        void reset() final;

        [[nodiscard]] auto end_of_buffer() const -> bool final;

        /// Write the given bytes into the buffer from the current cursor
        /// position. If the data extends beyond the end of the buffer, expands
        /// the buffer size to fit the new data.
        /// \param data pointer to the start of the bytes to write.
        /// \param len number of bytes to write.
        /// \return true.
        auto write(const void* data, size_t len) -> bool final;

        /// Read the given number of bytes from the buffer from the current
        /// cursor position into the given memory location.
        /// \param data pointer to the destination of the read data.
        /// \param len number of bytes to read from the buffer.
        /// \return true if the serializer read the requested number of bytes
        ///         from the buffer.
        auto read(void* data, size_t len) -> bool final;

      private:
        evoucher::buffer& m_pkt;
        size_t m_cursor{};
        bool m_valid{true};
    };
}

#endif // EVOUCHER_SRC_UTIL_SERIALIZATION_BUFFER_SERIALIZER_H_
