/**
 * @file net_error.hpp
 * @brief Error vocabulary of the application facing network adapter
 * @version 1.0
 * @date 2025-11-18
 *
 * Values follow the socket API convention of embedded network stacks
 * (negative codes, 0 for success) so callers can forward them unchanged.
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include <string>

#include "error.hpp"

namespace ublox {

    enum class NetError : int {
        OK = 0,
        WOULD_BLOCK = -3001,     ///< No data / buffer space right now, retry later
        UNSUPPORTED = -3002,     ///< Not compiled in or not available on this module
        PARAMETER = -3003,       ///< Invalid argument
        NO_CONNECTION = -3004,   ///< Not connected to a network
        NO_SOCKET = -3005,       ///< Socket table full or socket id invalid
        NO_ADDRESS = -3006,      ///< Address could not be parsed
        DNS_FAILURE = -3009,     ///< Host name lookup failed
        DEVICE_ERROR = -3012,    ///< Module failure or unexpected reply
        IN_PROGRESS = -3013,     ///< Operation still running
        CONNECTION_LOST = -3016, ///< Peer closed the connection
        TIMEOUT = -3019,         ///< Operation did not complete in time
        BUSY = -3020,            ///< Module busy with another command
        UNKNOWN = -3999
    };

    inline std::string error_message(NetError e) {
        switch (e) {
        case NetError::OK:              return "OK";
        case NetError::WOULD_BLOCK:     return "Would block";
        case NetError::UNSUPPORTED:     return "Unsupported";
        case NetError::PARAMETER:       return "Invalid parameter";
        case NetError::NO_CONNECTION:   return "Not connected to a network";
        case NetError::NO_SOCKET:       return "Socket not available";
        case NetError::NO_ADDRESS:      return "Invalid address";
        case NetError::DNS_FAILURE:     return "DNS failure";
        case NetError::DEVICE_ERROR:    return "Device error";
        case NetError::IN_PROGRESS:     return "In progress";
        case NetError::CONNECTION_LOST: return "Connection lost";
        case NetError::TIMEOUT:         return "Timeout";
        case NetError::BUSY:            return "Device busy";
        default:                        return "Unknown error";
        }
    }

    /**
     * @brief Translate a driver Status into the adapter vocabulary
     */
    inline NetError to_net_error(Status status) {
        switch (status) {
        case Status::SUCCESS:            return NetError::OK;
        case Status::BUSY:               return NetError::BUSY;
        case Status::TIMEOUT:            return NetError::TIMEOUT;
        case Status::NOT_READY:          return NetError::NO_CONNECTION;
        case Status::RESOURCE_EXHAUSTED: return NetError::NO_SOCKET;
        case Status::INVALID_HANDLE:     return NetError::NO_SOCKET;
        case Status::IN_PROGRESS:        return NetError::IN_PROGRESS;
        case Status::CLOSED:             return NetError::CONNECTION_LOST;
        case Status::INVALID_ARGUMENT:   return NetError::PARAMETER;
        case Status::UNSUPPORTED:        return NetError::UNSUPPORTED;
        case Status::PROTOCOL:
        case Status::FATAL:
        case Status::DNOT_FOUND:
        case Status::DNOT_OPEN:
        case Status::DREAD_ERROR:
        case Status::DWRITE_ERROR:
        case Status::DCONFIG_ERROR:
            return NetError::DEVICE_ERROR;
        default:
            return NetError::UNKNOWN;
        }
    }

} // namespace ublox
