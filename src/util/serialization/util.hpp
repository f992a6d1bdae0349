// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef EVOUCHER_SRC_UTIL_SERIALIZATION_UTIL_H_
#define EVOUCHER_SRC_UTIL_SERIALIZATION_UTIL_H_

#include "buffer_serializer.hpp"

#include <optional>

namespace evoucher {
    /// Serialize object into evoucher::buffer using a
    /// evoucher::buffer_serializer.
    /// \tparam T type of object to serialize.
    /// \return a serialized buffer of the object.
    template<typename T>
    auto make_buffer(const T& obj) -> evoucher::buffer {
        auto pkt = evoucher::buffer();
        auto ser = evoucher::buffer_serializer(pkt);
        ser << obj;
        return pkt;
    }

    /// Deserialize object of given type from a evoucher::buffer. Fails if
    /// the buffer is truncated or has trailing bytes.
    /// \tparam T default-constructible type to deserialize.
    /// \param buf buffer from which to deserialize the object.
    /// \return deserialized object, or std::nullopt if the deserialization
    ///         failed.
    template<typename T>
    auto from_buffer(evoucher::buffer& buf) -> std::optional<T> {
        auto deser = evoucher::buffer_serializer(buf);
        T ret{};
        if(!(deser >> ret) || !deser.end_of_buffer()) {
            return std::nullopt;
        }
        return ret;
    }
}

#endif // EVOUCHER_SRC_UTIL_SERIALIZATION_UTIL_H_
