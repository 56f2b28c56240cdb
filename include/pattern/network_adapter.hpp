/**
 * @file network_adapter.hpp
 * @brief Socket style API for application code
 * @version 1.0
 * @date 2025-11-18
 *
 * Blocking calls pump the driver until the underlying operation resolves and
 * report NetError codes. With UBLOX_FEATURE_ASYNC the *_async variants hand
 * out the in-flight markers of the same state machines instead; the caller
 * drives them with UbloxDriver::poll() and converts the Status with
 * to_net_error().
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include <string>

#include "../enums/net_error.hpp"
#include "../features.hpp"
#include "ublox_driver.hpp"

namespace ublox {

    enum class ConnectionStatus {
        DISCONNECTED,
        CONNECTING,
        LOCAL_UP,     ///< Access point running, no station link
        GLOBAL_UP     ///< Joined as station
    };

    std::string connection_status_to_string(ConnectionStatus status);

    class NetworkAdapter {
        public:
            explicit NetworkAdapter(UbloxDriver& driver);

            // === Interface ===

            /// Boot the module (if off) and switch it to EDM
            Result<void, NetError> initialize();

            /// Join a WiFi network, initializing the module first if needed
            Result<void, NetError> connect(const std::string& ssid,
                const std::string& passphrase = "");

            Result<void, NetError> disconnect();

            Result<void, NetError> start_access_point(const std::string& ssid,
                const std::string& passphrase = "", int channel = 6);

            Result<void, NetError> stop_access_point();

            /// Dotted IPv4 address for host (literals are returned unchanged)
            Result<std::string, NetError> gethostbyname(const std::string& host);

            bool is_connected() const;
            ConnectionStatus connection_status() const;

            // === Sockets ===

            /**
             * @brief Open and connect a socket
             * @param host IPv4 literal or host name
             */
            Result<SocketId, NetError> socket_open(SocketProtocol protocol, const std::string& host,
                std::uint16_t port);

            /**
             * @return Bytes accepted; WOULD_BLOCK when the tx buffer is full
             */
            Result<std::size_t, NetError> socket_send(SocketId id, span<const std::uint8_t> data);

            /**
             * @return Bytes read; WOULD_BLOCK when nothing is buffered; 0 once the
             *         peer closed the connection
             */
            Result<std::size_t, NetError> socket_recv(SocketId id, span<std::uint8_t> out);

            Result<void, NetError> socket_close(SocketId id);

#if UBLOX_FEATURE_ASYNC
            // === Cooperative API ===

            Pending<void> connect_async(const std::string& ssid, const std::string& passphrase = "");
            Pending<std::string> gethostbyname_async(const std::string& host);
            Pending<SocketId> socket_open_async(SocketProtocol protocol, const Endpoint& remote);
            Pending<void> socket_close_async(SocketId id);
#endif

        private:
            UbloxDriver& driver_;

            Millis script_budget(std::size_t commands) const;
            Millis boot_budget() const;

            template<typename T>
            static Result<T, NetError> translate(const Result<T>& result, const std::string& op);
            static Result<void, NetError> translate(const Result<void>& result, const std::string& op);
    };

} // namespace ublox
