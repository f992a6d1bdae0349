// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/** \file random_source.hpp
 *  Source of cryptographically secure random bytes backed by an entropy
 *  device.
 */

#ifndef EVOUCHER_SRC_UTIL_COMMON_RANDOM_SOURCE_H_
#define EVOUCHER_SRC_UTIL_COMMON_RANDOM_SOURCE_H_

#include <array>
#include <cstddef>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>

namespace evoucher {
    /// Reads random bytes from an entropy source, usually /dev/urandom.
    /// Access to the underlying stream is serialised so one instance can be
    /// shared between threads.
    class random_source {
      public:
        /// Default entropy source.
        static constexpr auto default_source = "/dev/urandom";

        /// Constructor. Opens the entropy source.
        /// \param source_file path to the file to read random bytes from.
        explicit random_source(const std::string& source_file
                               = default_source);
        ~random_source() = default;

        random_source(const random_source& other) = delete;
        auto operator=(const random_source& other) = delete;

        random_source(random_source&& other) = delete;
        auto operator=(random_source&& other) = delete;

        /// Indicates whether the entropy source was opened successfully and
        /// has not failed since.
        /// \return true if random bytes can be read.
        [[nodiscard]] auto good() const -> bool;

        /// Fills the given memory with random bytes.
        /// \param dest pointer to the destination.
        /// \param len number of bytes to write.
        /// \return true if exactly len bytes were read from the source.
        auto read(unsigned char* dest, size_t len) -> bool;

        /// Returns N random bytes.
        /// \return the random bytes, or std::nullopt if the source failed.
        template<size_t N>
        auto random_bytes() -> std::optional<std::array<unsigned char, N>> {
            auto ret = std::array<unsigned char, N>();
            if(!read(ret.data(), ret.size())) {
                return std::nullopt;
            }
            return ret;
        }

      private:
        mutable std::mutex m_mut;
        std::ifstream m_source;
    };
}

#endif // EVOUCHER_SRC_UTIL_COMMON_RANDOM_SOURCE_H_
