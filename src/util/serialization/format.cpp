// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "format.hpp"

#include <cstring>

namespace evoucher {
    namespace {
        /// Reads a length prefix and the bytes it announces, reserving no
        /// more than \ref config::maximum_reservation ahead of the data
        /// actually received.
        template<typename Container>
        auto read_sized(serializer& deser, Container& out) -> serializer& {
            uint64_t len{};
            if(!(deser >> len)) {
                return deser;
            }

            auto ret = Container();
            uint64_t done = 0;
            while(done < len) {
                const auto chunk
                    = std::min(len - done, config::maximum_reservation);
                const auto offset = ret.size();
                ret.resize(offset + chunk);
                if(!deser.read(&ret[offset], chunk)) {
                    return deser;
                }
                done += chunk;
            }

            out = std::move(ret);
            return deser;
        }
    }

    auto operator<<(serializer& packet, std::byte b) -> serializer& {
        packet << static_cast<uint8_t>(b);
        return packet;
    }

    auto operator>>(serializer& packet, std::byte& b) -> serializer& {
        uint8_t val{};

        if(packet >> val) {
            b = static_cast<std::byte>(val);
        }

        return packet;
    }

    auto operator<<(serializer& ser, const buffer& b) -> serializer& {
        ser << static_cast<uint64_t>(b.size());
        ser.write(b.data(), b.size());
        return ser;
    }

    auto operator>>(serializer& deser, buffer& b) -> serializer& {
        auto bytes = std::vector<unsigned char>();
        if(!read_sized(deser, bytes)) {
            return deser;
        }
        b.clear();
        b.append(bytes.data(), bytes.size());
        return deser;
    }

    auto operator<<(serializer& ser, const std::string& s) -> serializer& {
        ser << static_cast<uint64_t>(s.size());
        ser.write(s.data(), s.size());
        return ser;
    }

    auto operator>>(serializer& deser, std::string& s) -> serializer& {
        return read_sized(deser, s);
    }

    auto operator<<(serializer& ser, double d) -> serializer& {
        static_assert(sizeof(double) == sizeof(uint64_t));
        uint64_t bits{};
        std::memcpy(&bits, &d, sizeof(bits));
        return ser << bits;
    }

    auto operator>>(serializer& deser, double& d) -> serializer& {
        uint64_t bits{};
        if(deser >> bits) {
            std::memcpy(&d, &bits, sizeof(d));
        }
        return deser;
    }
}
