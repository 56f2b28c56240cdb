/**
 * @file edm_frame.hpp
 * @brief Extended Data Mode frame and connect event payload
 * @version 1.0
 * @date 2025-11-18
 *
 * Frame structure:
 * ```
 * [START][LEN_HI][LEN_LO][ID_HI][ID_LO][CHANNEL?][PAYLOAD...][END]
 *   0xAA   low nibble           0x00                          0x55
 * ```
 * LEN counts PAYLOAD_ID + PAYLOAD (start and stop excluded), 12 bits.
 * The channel byte is present for connect/disconnect/data frames only.
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "endpoint.hpp"
#include "../enums/protocol.hpp"
#include "../template/result.hpp"

namespace ublox {

    /**
     * @brief Byte offsets inside a serialized EDM frame
     */
    struct EdmLayout {
        static constexpr std::size_t START = 0;
        static constexpr std::size_t LEN_HI = 1;
        static constexpr std::size_t LEN_LO = 2;
        static constexpr std::size_t ID_HI = 3;
        static constexpr std::size_t ID_LO = 4;
        static constexpr std::size_t PAYLOAD = 5;

        /// Total frame size for a LEN field value
        static constexpr std::size_t frame_size(std::size_t length) {
            return length + EDM_OVERHEAD;
        }
    };

    /**
     * @brief One EDM frame, independent of its wire representation
     */
    struct EdmFrame {
        PayloadType type = PayloadType::UNKNOWN;
        std::optional<std::uint8_t> channel;
        std::vector<std::uint8_t> payload;

        // === Factories ===
        static EdmFrame at_request(const std::string& command_text);
        static EdmFrame data_command(std::uint8_t channel, span<const std::uint8_t> data);
        static EdmFrame resend_connect_events();

        /// Payload interpreted as text (AT request/confirmation/event)
        std::string text() const;

        /// Value of the LEN field for this frame
        std::size_t wire_length() const;

        /**
         * @brief Encode to wire bytes
         * @return WBAD_LENGTH if the payload exceeds the 12-bit length field,
         *         WBAD_PAYLOAD if the channel byte is missing or unexpected
         */
        Result<std::vector<std::uint8_t> > serialize() const;

        /**
         * @brief Decode exactly one complete frame
         * @param buffer Bytes from START to END inclusive
         */
        static Result<EdmFrame> deserialize(span<const std::uint8_t> buffer);

        bool operator==(const EdmFrame& other) const {
            return type == other.type && channel == other.channel && payload == other.payload;
        }

        bool operator!=(const EdmFrame& other) const {
            return !(*this == other);
        }
    };

    /**
     * @brief Decoded ConnectEvent payload
     *
     * IPv4 layout after the channel byte:
     * `[TYPE=0x02][PROTO][REMOTE_IP(4)][REMOTE_PORT(2,BE)][LOCAL_IP(4)][LOCAL_PORT(2,BE)]`
     * IPv6 uses 16-byte addresses. Bluetooth:
     * `[TYPE=0x01][PROFILE][BD_ADDR(6)][FRAME_SIZE(2,BE)]`
     */
    struct ConnectEvent {
        std::uint8_t channel = 0;
        ConnectionType type = ConnectionType::IPV4;
        SocketProtocol protocol = SocketProtocol::TCP;
        std::vector<std::uint8_t> remote_address;
        std::uint16_t remote_port = 0;
        std::vector<std::uint8_t> local_address;
        std::uint16_t local_port = 0;
        std::uint8_t bluetooth_profile = 0;
        std::uint16_t frame_size = 0;

        static Result<ConnectEvent> parse(const EdmFrame& frame);

        /// Remote side as an IPv4 endpoint, nullopt for IPv6/Bluetooth
        std::optional<Endpoint> remote_ipv4() const;

        /// Build the frame a module would send (used by tests and loopback tools)
        EdmFrame to_frame() const;
    };

} // namespace ublox
