/**
 * @file endpoint.hpp
 * @brief IPv4 address and port pair used by sockets and connect events
 * @version 1.0
 * @date 2025-11-18
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>

namespace ublox {

    struct Endpoint {
        std::array<std::uint8_t, 4> address{};
        std::uint16_t port = 0;

        /**
         * @brief Parse a dotted quad ("10.0.0.5")
         * @return std::nullopt if the text is not an IPv4 literal
         */
        static std::optional<Endpoint> parse(const std::string& ip, std::uint16_t port);

        /// "a.b.c.d"
        std::string address_string() const;

        /// "a.b.c.d:port"
        std::string to_string() const;

        bool operator==(const Endpoint& other) const {
            return address == other.address && port == other.port;
        }

        bool operator!=(const Endpoint& other) const {
            return !(*this == other);
        }
    };

} // namespace ublox
