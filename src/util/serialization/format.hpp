// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef EVOUCHER_SRC_UTIL_SERIALIZATION_FORMAT_H_
#define EVOUCHER_SRC_UTIL_SERIALIZATION_FORMAT_H_

#include "serializer.hpp"
#include "util/common/buffer.hpp"
#include "util/common/config.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace evoucher {
    /// Serializes the std::byte as a std::uint8_t.
    auto operator<<(serializer& packet, std::byte b) -> serializer&;

    /// \brief Deserializes a single std::byte.
    ///
    /// \see \ref evoucher::operator<<(serializer&, std::byte)
    auto operator>>(serializer& packet, std::byte& b) -> serializer&;

    /// \brief Serializes a raw byte buffer.
    ///
    /// Writes the size of the buffer as a 64-bit uint, followed by the actual
    /// buffer data.
    ///
    /// \see \ref evoucher::operator>>(serializer&, buffer&)
    auto operator<<(serializer& ser, const buffer& b) -> serializer&;

    /// \brief Deserializes a raw byte buffer.
    auto operator>>(serializer& deser, buffer& b) -> serializer&;

    /// \brief Serializes a string.
    ///
    /// Writes the length of the string as a 64-bit uint, followed by its
    /// characters.
    auto operator<<(serializer& ser, const std::string& s) -> serializer&;

    /// \brief Deserializes a string.
    /// \see \ref evoucher::operator<<(serializer&, const std::string&)
    auto operator>>(serializer& deser, std::string& s) -> serializer&;

    /// \brief Serializes a double as its IEEE-754 bit pattern.
    auto operator<<(serializer& ser, double d) -> serializer&;

    /// \brief Deserializes a double.
    /// \see \ref evoucher::operator<<(serializer&, double)
    auto operator>>(serializer& deser, double& d) -> serializer&;

    /// \brief Serializes the integral argument.
    ///
    /// Copies `sizeof(T)` bytes from `t` following machine endianness.
    ///
    /// \tparam T the integral type of the value to serialize
    /// \param t the value to serialize
    template<typename T>
    auto operator<<(serializer& s, T t) ->
        typename std::enable_if_t<std::is_integral_v<T> && !std::is_enum_v<T>,
                                  serializer&> {
        s.write(&t, sizeof(t));
        return s;
    }

    /// \brief Deserializes the integral argument.
    ///
    /// Writes `sizeof(T)` bytes into `t` following machine endianness.
    ///
    /// \see \ref evoucher::operator<<(serializer&, T)
    template<typename T>
    auto operator>>(serializer& s, T& t) ->
        typename std::enable_if_t<std::is_integral_v<T> && !std::is_enum_v<T>,
                                  serializer&> {
        s.read(&t, sizeof(t));
        return s;
    }

    /// Serializes the array of integral values in-order.
    ///
    /// \tparam T the underlying integral type
    /// \tparam len the length of the array to be serialized
    /// \param packet the serializer to receive the data
    /// \param arr the array of data to be serialized
    template<typename T, size_t len>
    auto operator<<(serializer& packet, const std::array<T, len>& arr) ->
        typename std::enable_if_t<std::is_integral_v<T>, serializer&> {
        packet.write(arr.data(), sizeof(T) * len);
        return packet;
    }

    /// Deserializes the array of integral values in-order.
    /// \see \ref evoucher::operator<<(serializer&, const std::array<T, len>&)
    template<typename T, size_t len>
    auto operator>>(serializer& packet, std::array<T, len>& arr) ->
        typename std::enable_if_t<std::is_integral_v<T>, serializer&> {
        packet.read(arr.data(), sizeof(T) * len);
        return packet;
    }

    /// Deserializes an optional value.
    /// \see \ref evoucher::operator<<(serializer&, const std::optional<T>&)
    template<typename T>
    auto operator>>(serializer& deser, std::optional<T>& val) -> serializer& {
        bool has_value{};
        if(!(deser >> has_value)) {
            return deser;
        }

        if(has_value) {
            auto opt_val = T();
            if(!(deser >> opt_val)) {
                return deser;
            }
            val = std::move(opt_val);
        } else {
            val = std::nullopt;
        }

        return deser;
    }

    /// Serializes `val.has_value()`, and if `val.has_value() == true`,
    /// serializes the value itself.
    template<typename T>
    auto operator<<(serializer& ser, const std::optional<T>& val)
        -> serializer& {
        auto has_value = val.has_value();
        ser << has_value;
        if(has_value) {
            ser << *val;
        }
        return ser;
    }

    /// Serializes the count of elements in the vector, and then each element
    /// in-order.
    template<typename T>
    auto operator<<(serializer& packet, const std::vector<T>& vec)
        -> serializer& {
        const auto len = static_cast<uint64_t>(vec.size());
        packet << len;
        for(const auto& elem : vec) {
            packet << elem;
        }
        return packet;
    }

    /// Deserializes a vector of default-constructible elements.
    /// \see \ref evoucher::operator<<(serializer&, const std::vector<T>&)
    template<typename T>
    auto operator>>(serializer& packet, std::vector<T>& vec) -> serializer& {
        static_assert(sizeof(T) <= config::maximum_reservation,
                      "Vector element size too large");

        uint64_t len{};
        if(!(packet >> len)) {
            return packet;
        }

        uint64_t allocated = 0;
        while(allocated < len) {
            allocated = std::min(
                len,
                allocated + config::maximum_reservation / sizeof(T));
            vec.reserve(allocated);
            while(vec.size() < allocated) {
                T val{};
                if(!(packet >> val)) {
                    return packet;
                }
                vec.push_back(std::move(val));
            }
        }

        return packet;
    }

    /// Serializes the count of key-value pairs, and then each key and value
    /// in key order.
    template<typename K, typename V, typename... Ts>
    auto operator<<(serializer& ser, const std::map<K, V, Ts...>& map)
        -> serializer& {
        auto len = static_cast<uint64_t>(map.size());
        ser << len;
        for(const auto& it : map) {
            ser << it.first;
            ser << it.second;
        }
        return ser;
    }

    /// Deserializes a map of key-value pairs.
    /// \see \ref evoucher::operator<<(serializer&, const std::map<K, V, Ts...>&)
    template<typename K, typename V, typename... Ts>
    auto operator>>(serializer& deser, std::map<K, V, Ts...>& map)
        -> serializer& {
        auto len = uint64_t();
        if(!(deser >> len)) {
            return deser;
        }

        for(uint64_t i = 0; i < len; i++) {
            auto key = K();
            if(!(deser >> key)) {
                return deser;
            }

            auto val = V();
            if(!(deser >> val)) {
                return deser;
            }

            map.emplace(std::move(key), std::move(val));
        }

        return deser;
    }

    /// Serializes an enum via its underlying type.
    template<typename T>
    auto operator<<(serializer& ser, T e) ->
        typename std::enable_if_t<std::is_enum_v<T>, serializer&> {
        return ser << static_cast<std::underlying_type_t<T>>(e);
    }

    /// Deserializes an enum.
    template<typename T>
    auto operator>>(serializer& deser, T& e) ->
        typename std::enable_if_t<std::is_enum_v<T>, serializer&> {
        std::underlying_type_t<T> val{};
        if(deser >> val) {
            e = static_cast<T>(val);
        }
        return deser;
    }
}

#endif // EVOUCHER_SRC_UTIL_SERIALIZATION_FORMAT_H_
