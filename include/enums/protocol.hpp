/**
 * @file protocol.hpp
 * @brief Protocol definitions and helper functions for the u-blox short-range link.
 * @version 1.0
 * @date 2025-11-18
 *
 * Extended Data Mode (EDM) constants, payload identifiers, serial baud rates and
 * byte manipulation helpers shared by the codec and the higher layers.
 *
 * @copyright Copyright (c) 2025
 *
 */


#pragma once

#include <cstdint>
#include <cstddef>
#include <type_traits>
#include <string>
#include <sstream>
#include <iomanip>
#include <array>
#include <boost/core/span.hpp>
using namespace boost;

/**
 * @namespace ublox
 * @brief Namespace containing all u-blox short-range driver functionality.
 */
namespace ublox {

    // === Frame Byte Constants ===

    /**
     * @brief Special byte values delimiting an EDM frame.
     */
    enum class Constants : std::uint8_t {
        START_BYTE = 0xAA,
        END_BYTE = 0x55,
        PAYLOAD_ID_HIGH = 0x00,
    };

    // === EDM Layout ===
    static constexpr std::uint8_t EDM_SIZE_FILTER = 0x0F;          ///< Mask for the length high byte
    static constexpr std::uint16_t EDM_FULL_SIZE_FILTER = 0x0FFF;  ///< Mask for the 12-bit length
    static constexpr std::size_t EDM_OVERHEAD = 4;          ///< start + length(2) + stop
    static constexpr std::size_t EDM_HEADER_SIZE = 5;       ///< start + length(2) + payload id(2)
    static constexpr std::size_t PAYLOAD_ID_SIZE = 2;
    static constexpr std::size_t MAX_EDM_LENGTH = EDM_FULL_SIZE_FILTER;  ///< Largest LENGTH field
    static constexpr std::size_t MAX_EDM_PAYLOAD = MAX_EDM_LENGTH - PAYLOAD_ID_SIZE;
    static constexpr std::size_t EGRESS_CHUNK_SIZE = 512;   ///< Data bytes per DataCommand frame

    /**
     * @brief EDM payload identifiers (low byte of PAYLOAD_ID).
     */
    enum class PayloadType : std::uint8_t {
        UNKNOWN = 0x00,
        CONNECT_EVENT = 0x11,       ///< Module -> host: data channel opened
        DISCONNECT_EVENT = 0x21,    ///< Module -> host: data channel closed
        DATA_EVENT = 0x31,          ///< Module -> host: payload on a channel
        DATA_COMMAND = 0x36,        ///< Host -> module: payload for a channel
        AT_EVENT = 0x41,            ///< Module -> host: URC text
        AT_REQUEST = 0x44,          ///< Host -> module: AT command text
        AT_CONFIRMATION = 0x45,     ///< Module -> host: AT response text
        RESEND_CONNECT_EVENTS = 0x56, ///< Host -> module: replay connect events
        IPHONE_EVENT = 0x61,        ///< Module -> host: iAP event, not handled
        START_EVENT = 0x71,         ///< Module -> host: EDM started
    };

    /**
     * @brief Connection type byte of a ConnectEvent.
     */
    enum class ConnectionType : std::uint8_t {
        BLUETOOTH = 0x01,
        IPV4 = 0x02,
        IPV6 = 0x03,
    };

    /**
     * @brief Transport protocol, used both on the wire and for logical sockets.
     */
    enum class SocketProtocol : std::uint8_t {
        TCP = 0x00,
        UDP = 0x01,
    };

    inline std::string protocol_to_string(SocketProtocol protocol) {
        return protocol == SocketProtocol::TCP ? "tcp" : "udp";
    }

    /**
     * @brief Serial baud rates supported by the short-range modules.
     */
    enum class SerialBaud : std::uint32_t {
        BAUD_9600 = 9600,
        BAUD_19200 = 19200,
        BAUD_38400 = 38400,
        BAUD_57600 = 57600,
        BAUD_115200 = 115200,   // <<< Factory default
        BAUD_230400 = 230400,
        BAUD_460800 = 460800,
        BAUD_921600 = 921600,
        BAUD_1M = 1000000,
        BAUD_2M = 2000000,
        BAUD_3M = 3000000,
        BAUD_5_25M = 5250000
    };
    static constexpr SerialBaud DEFAULT_SERIAL_BAUD = SerialBaud::BAUD_115200;

    // === Enum Helper Functions ===

    /**
     * @brief Converts an enum value to std::uint8_t.
     *
     * @example
     * @code
     * auto start_byte = to_byte(Constants::START_BYTE);
     * auto type_byte = to_byte(PayloadType::AT_REQUEST);
     * @endcode
     */
    template<typename EnumType> constexpr std::uint8_t to_byte(EnumType value) {
        return static_cast<std::uint8_t>(
            static_cast<std::underlying_type_t<EnumType> >(value));
    }

    template<typename EnumType> constexpr EnumType from_byte(std::uint8_t value) {
        return static_cast<EnumType>(
            static_cast<std::underlying_type_t<EnumType> >(value));
    }

    /**
     * @brief Map a raw payload id byte onto a known PayloadType.
     * @return PayloadType::UNKNOWN for identifiers the driver does not know
     */
    constexpr PayloadType payload_type_from_byte(std::uint8_t value) {
        switch (value) {
        case 0x11: return PayloadType::CONNECT_EVENT;
        case 0x21: return PayloadType::DISCONNECT_EVENT;
        case 0x31: return PayloadType::DATA_EVENT;
        case 0x36: return PayloadType::DATA_COMMAND;
        case 0x41: return PayloadType::AT_EVENT;
        case 0x44: return PayloadType::AT_REQUEST;
        case 0x45: return PayloadType::AT_CONFIRMATION;
        case 0x56: return PayloadType::RESEND_CONNECT_EVENTS;
        case 0x61: return PayloadType::IPHONE_EVENT;
        case 0x71: return PayloadType::START_EVENT;
        default:   return PayloadType::UNKNOWN;
        }
    }

    /**
     * @brief True for payload types whose first payload byte is a channel id.
     */
    constexpr bool carries_channel(PayloadType type) {
        return type == PayloadType::CONNECT_EVENT
               || type == PayloadType::DISCONNECT_EVENT
               || type == PayloadType::DATA_EVENT
               || type == PayloadType::DATA_COMMAND;
    }

    inline std::string payload_type_to_string(PayloadType type) {
        switch (type) {
        case PayloadType::CONNECT_EVENT:         return "CONNECT_EVENT";
        case PayloadType::DISCONNECT_EVENT:      return "DISCONNECT_EVENT";
        case PayloadType::DATA_EVENT:            return "DATA_EVENT";
        case PayloadType::DATA_COMMAND:          return "DATA_COMMAND";
        case PayloadType::AT_EVENT:              return "AT_EVENT";
        case PayloadType::AT_REQUEST:            return "AT_REQUEST";
        case PayloadType::AT_CONFIRMATION:       return "AT_CONFIRMATION";
        case PayloadType::RESEND_CONNECT_EVENTS: return "RESEND_CONNECT_EVENTS";
        case PayloadType::IPHONE_EVENT:          return "IPHONE_EVENT";
        case PayloadType::START_EVENT:           return "START_EVENT";
        default:                                 return "UNKNOWN";
        }
    }

    /**
     * @brief Parse an integer baud rate.
     * @param baud Baud rate in bits per second
     * @param use_default Set to true (and DEFAULT_SERIAL_BAUD returned) when unsupported
     */
    inline SerialBaud serialbaud_from_int(std::uint32_t baud, bool& use_default) {
        use_default = false;
        switch (baud) {
        case 9600:    return SerialBaud::BAUD_9600;
        case 19200:   return SerialBaud::BAUD_19200;
        case 38400:   return SerialBaud::BAUD_38400;
        case 57600:   return SerialBaud::BAUD_57600;
        case 115200:  return SerialBaud::BAUD_115200;
        case 230400:  return SerialBaud::BAUD_230400;
        case 460800:  return SerialBaud::BAUD_460800;
        case 921600:  return SerialBaud::BAUD_921600;
        case 1000000: return SerialBaud::BAUD_1M;
        case 2000000: return SerialBaud::BAUD_2M;
        case 3000000: return SerialBaud::BAUD_3M;
        case 5250000: return SerialBaud::BAUD_5_25M;
        default:
            use_default = true;
            return DEFAULT_SERIAL_BAUD;
        }
    }

    /**
     * @brief Baud rate as the integer termios2 expects with BOTHER.
     */
    constexpr std::uint32_t to_baud_value(SerialBaud baud) {
        return static_cast<std::uint32_t>(baud);
    }

    // === Byte Manipulation Helpers ===

    /**
     * @brief Converts an unsigned integer to a big-endian byte array.
     * @example
     * @code
     * auto bytes = int_to_bytes_be<uint16_t, 2>(0x1234); // bytes = {0x12, 0x34}
     * @endcode
     */
    template<typename T, std::size_t N = sizeof(T)>
    constexpr std::array<std::uint8_t, N> int_to_bytes_be(T value) {
        static_assert(std::is_unsigned<T>::value, "T must be an unsigned integer type");
        static_assert(N > 0 && N <= sizeof(T), "N must be between 1 and sizeof(T)");
        std::array<std::uint8_t, N> bytes = {};
        for (std::size_t i = 0; i < N; ++i) {
            bytes[N - 1 - i] = static_cast<std::uint8_t>(value & 0xFF);
            value >>= 8;
        }
        return bytes;
    }

    /**
     * @brief Converts a big-endian byte sequence to an unsigned integer.
     */
    template<typename T>
    constexpr T bytes_to_int_be(span<const std::uint8_t> bytes) {
        static_assert(std::is_unsigned<T>::value, "T must be an unsigned integer type");
        T value = 0;
        for (std::size_t i = 0; i < bytes.size() && i < sizeof(T); ++i) {
            value = static_cast<T>((value << 8) | (static_cast<T>(bytes[i]) & 0xFF));
        }
        return value;
    }

    /**
     * @brief Hex dump used by traffic tracing ("AA 00 06 ...").
     */
    inline std::string to_hex(span<const std::uint8_t> bytes) {
        std::ostringstream oss;
        oss << std::hex << std::uppercase << std::setfill('0');
        for (std::size_t i = 0; i < bytes.size(); ++i) {
            if (i > 0) oss << ' ';
            oss << std::setw(2) << static_cast<int>(bytes[i]);
        }
        return oss.str();
    }

}     // namespace ublox
