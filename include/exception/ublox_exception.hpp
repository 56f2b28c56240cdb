/**
 * @file ublox_exception.hpp
 * @brief Exception hierarchy for the ublox driver
 * @version 1.0
 * @date 2025-11-18
 *
 * Exceptions are raised at construction and configuration boundaries only
 * (opening the serial device, loading configuration). Runtime operations
 * report failures through Result.
 *
 * @copyright Copyright (c) 2025
 *
 */

#pragma once

#include <stdexcept>
#include <string>
#include "../enums/error.hpp"

namespace ublox {

    /**
     * @class UbloxException
     * @brief Base exception class for all driver errors
     *
     * Stores the original Status code for programmatic error handling
     * while providing a descriptive error message via what().
     */
    class UbloxException : public std::runtime_error {
        protected:
            Status status_;     ///< Original error status code
            std::string context_; ///< Operation context (function name, etc.)

        public:
            /**
             * @brief Construct exception with status code and context
             * @param status The error status code
             * @param context Description of where the error occurred
             */
            UbloxException(Status status, const std::string& context)
                : std::runtime_error(format_message(status, context)),
                status_(status),
                context_(context) {}

            Status status() const noexcept { return status_; }

            const std::string& context() const noexcept { return context_; }

        private:
            static std::string format_message(Status status, const std::string& context) {
                return "[" + error_message(status) + "] in " + context;
            }
    };

    // === Derived Exception Classes ===

    /**
     * @class ProtocolException
     * @brief Wire format and module reply violations (WBAD_*, PROTOCOL)
     */
    class ProtocolException : public UbloxException {
        public:
            using UbloxException::UbloxException;
    };

    /**
     * @class DeviceException
     * @brief Serial device I/O and configuration errors (D* codes)
     */
    class DeviceException : public UbloxException {
        public:
            using UbloxException::UbloxException;
    };

    /**
     * @class TimeoutException
     * @brief Operation exceeded its time budget (TIMEOUT)
     */
    class TimeoutException : public UbloxException {
        public:
            using UbloxException::UbloxException;
    };

    /**
     * @class StateException
     * @brief Device or socket in the wrong state for the request
     *
     * Corresponds to NOT_READY, BUSY, INVALID_HANDLE, RESOURCE_EXHAUSTED and FATAL.
     */
    class StateException : public UbloxException {
        public:
            using UbloxException::UbloxException;
    };

    // === Exception Factory Helpers ===

    /**
     * @brief Throw appropriate exception based on status code
     * @param status The error status code
     * @param context Description of where the error occurred
     * @throws ProtocolException for WBAD_* and PROTOCOL
     * @throws DeviceException for D* codes
     * @throws TimeoutException for TIMEOUT
     * @throws StateException for state related codes
     * @throws UbloxException for other codes
     */
    inline void throw_error(Status status, const std::string& context) {
        switch (status) {
        case Status::WBAD_START:
        case Status::WBAD_LENGTH:
        case Status::WBAD_END:
        case Status::WBAD_PAYLOAD_ID:
        case Status::WBAD_PAYLOAD:
        case Status::WINCOMPLETE:
        case Status::PROTOCOL:
            throw ProtocolException(status, context);

        case Status::DNOT_FOUND:
        case Status::DNOT_OPEN:
        case Status::DREAD_ERROR:
        case Status::DWRITE_ERROR:
        case Status::DCONFIG_ERROR:
            throw DeviceException(status, context);

        case Status::TIMEOUT:
            throw TimeoutException(status, context);

        case Status::BUSY:
        case Status::NOT_READY:
        case Status::INVALID_HANDLE:
        case Status::RESOURCE_EXHAUSTED:
        case Status::FATAL:
            throw StateException(status, context);

        default:
            throw UbloxException(status, context);
        }
    }

    /**
     * @brief Throw if status indicates an error (not SUCCESS)
     */
    inline void throw_if_error(Status status, const std::string& context) {
        if (status != Status::SUCCESS) {
            throw_error(status, context);
        }
    }

} // namespace ublox
