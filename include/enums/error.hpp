/**
 * @file error.hpp
 * @brief Status codes shared by every ublox driver layer.
 * @version 1.0
 * @date 2025-11-18
 *
 * @copyright Copyright (c) 2025
 */

#pragma once
#include <string>
#include <system_error>
#include <type_traits>

namespace ublox {

/**
 * @enum Status
 * @brief Enumeration of error codes for ublox driver operations.
 * These codes can be converted to std::error_code for integration with
 * standard error handling mechanisms.
 * @note SUCCESS (0) indicates no error.
 * If starts with 'W' it is a frame-level warning (recovered locally, never surfaced).
 * If starts with 'D' it is a device-related error.
 * @see std::error_code
 */
    enum class Status : int {
        SUCCESS = 0,            /**< No error */
        BUSY = 1,               /**< Command channel occupied */
        TIMEOUT = 2,            /**< No terminal response within budget */
        NOT_READY = 3,          /**< Device or network not in the required state */
        RESOURCE_EXHAUSTED = 4, /**< Socket table full */
        INVALID_HANDLE = 5,     /**< Unknown or stale socket id */
        PROTOCOL = 6,           /**< Malformed response or unexpected module reply */
        FATAL = 7,              /**< Boot or reset failure, full reinitialization required */
        IN_PROGRESS = 8,        /**< Operation still in flight */
        CLOSED = 9,             /**< Connection closed by the remote peer */
        INVALID_ARGUMENT = 10,  /**< Caller supplied an invalid argument */
        UNSUPPORTED = 11,       /**< Not available on this module variant or build */
        WBAD_START = 20,        /**< Bad start byte */
        WBAD_LENGTH = 21,       /**< Bad frame length */
        WBAD_END = 22,          /**< Bad stop byte */
        WBAD_PAYLOAD_ID = 23,   /**< Unknown payload identifier */
        WBAD_PAYLOAD = 24,      /**< Payload does not match its identifier */
        WINCOMPLETE = 25,       /**< Not enough bytes for a complete frame */
        DNOT_FOUND = 30,        /**< Device not found */
        DNOT_OPEN = 31,         /**< Device not open */
        DREAD_ERROR = 32,       /**< Device read error */
        DWRITE_ERROR = 33,      /**< Device write error */
        DCONFIG_ERROR = 34,     /**< Device configuration error */
        UNKNOWN = 255           /**< Unknown error */
    };

/**
 * @class UbloxErrorCategory
 * @brief Custom error category for ublox driver errors.
 */
    class UbloxErrorCategory : public std::error_category {
        public:
            const char*name() const noexcept override {
                return "ublox::Status";
            }

            std::string message(int ev) const override {
                switch (static_cast<Status>(ev)) {
                case Status::SUCCESS:
                    return "Success";
                case Status::BUSY:
                    return "Command channel busy";
                case Status::TIMEOUT:
                    return "Timeout";
                case Status::NOT_READY:
                    return "Device not ready";
                case Status::RESOURCE_EXHAUSTED:
                    return "Socket table full";
                case Status::INVALID_HANDLE:
                    return "Invalid socket handle";
                case Status::PROTOCOL:
                    return "Protocol error";
                case Status::FATAL:
                    return "Fatal device failure";
                case Status::IN_PROGRESS:
                    return "Operation in progress";
                case Status::CLOSED:
                    return "Connection closed by peer";
                case Status::INVALID_ARGUMENT:
                    return "Invalid argument";
                case Status::UNSUPPORTED:
                    return "Unsupported operation";
                case Status::WBAD_START:
                    return "Bad start byte";
                case Status::WBAD_LENGTH:
                    return "Bad frame length";
                case Status::WBAD_END:
                    return "Bad stop byte";
                case Status::WBAD_PAYLOAD_ID:
                    return "Bad payload identifier";
                case Status::WBAD_PAYLOAD:
                    return "Bad payload";
                case Status::WINCOMPLETE:
                    return "Incomplete frame";
                case Status::DNOT_FOUND:
                    return "Device not found";
                case Status::DNOT_OPEN:
                    return "Device not open";
                case Status::DREAD_ERROR:
                    return "Device read error";
                case Status::DWRITE_ERROR:
                    return "Device write error";
                case Status::DCONFIG_ERROR:
                    return "Device configuration error";
                case Status::UNKNOWN:
                    return "Unknown error";
                default:
                    return "Unrecognized error";
                }
            }
    };

// Get the error category instance
    inline const std::error_category &ublox_category() {
        static UbloxErrorCategory instance;
        return instance;
    }

// Make error_code from Status
    inline std::error_code make_error_code(Status e) {
        return {static_cast<int>(e), ublox_category()};
    }

// Human readable message, used by Result::describe()
    inline std::string error_message(Status e) {
        return ublox_category().message(static_cast<int>(e));
    }

} // namespace ublox

// Register the enum for use with std::error_code
namespace std {
    template<> struct is_error_code_enum<ublox::Status> : true_type {};
} // namespace std
