/**
 * @file test_network_adapter.cpp
 * @brief Unit tests for the socket style adapter and its error translation
 * @version 1.0
 * @date 2025-11-18
 */

#include <catch2/catch_test_macros.hpp>
#include <string>
#include <vector>

#include "../include/pattern/network_adapter.hpp"
#include "test_utils.hpp"

using namespace ublox;
using namespace ublox::test;

namespace {

    span<const std::uint8_t> as_bytes(const std::string& text) {
        return span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(text.data()),
            text.size());
    }

    void script_bring_up(MockSerialPort& port) {
        script_boot(port);
        script_edm_entry(port);
        script_join(port);
    }

} // namespace

TEST_CASE("to_net_error - Status translation", "[adapter][errors]") {
    REQUIRE(to_net_error(Status::SUCCESS) == NetError::OK);
    REQUIRE(to_net_error(Status::NOT_READY) == NetError::NO_CONNECTION);
    REQUIRE(to_net_error(Status::RESOURCE_EXHAUSTED) == NetError::NO_SOCKET);
    REQUIRE(to_net_error(Status::INVALID_HANDLE) == NetError::NO_SOCKET);
    REQUIRE(to_net_error(Status::CLOSED) == NetError::CONNECTION_LOST);
    REQUIRE(to_net_error(Status::TIMEOUT) == NetError::TIMEOUT);
    REQUIRE(to_net_error(Status::FATAL) == NetError::DEVICE_ERROR);
    REQUIRE(to_net_error(Status::DWRITE_ERROR) == NetError::DEVICE_ERROR);
    REQUIRE(to_net_error(Status::WBAD_START) == NetError::UNKNOWN);
    REQUIRE(error_message(NetError::DNS_FAILURE) == "DNS failure");
}

TEST_CASE("NetworkAdapter - Bring-up", "[adapter]") {
    auto m = create_driver_with_mocks();
    NetworkAdapter adapter(*m.driver);

    REQUIRE(adapter.connection_status() == ConnectionStatus::DISCONNECTED);
    REQUIRE_FALSE(adapter.is_connected());

    SECTION("Connect boots and enters EDM on demand") {
        script_bring_up(*m.port);
        auto connected = adapter.connect("HomeNet", "secret-pass");

        REQUIRE(connected);
        REQUIRE(adapter.is_connected());
        REQUIRE(adapter.connection_status() == ConnectionStatus::GLOBAL_UP);
        REQUIRE(m.driver->device().state() == DeviceState::EDM_MODE);
    }

    SECTION("Initialize alone leaves the network down") {
        script_boot(*m.port);
        script_edm_entry(*m.port);
        REQUIRE(adapter.initialize());
        REQUIRE(m.driver->device().state() == DeviceState::EDM_MODE);
        REQUIRE(adapter.connection_status() == ConnectionStatus::DISCONNECTED);
    }

    SECTION("Silent module") {
        auto connected = adapter.connect("HomeNet", "secret-pass");
        REQUIRE(connected.error() == NetError::DEVICE_ERROR);
        REQUIRE(adapter.connection_status() == ConnectionStatus::DISCONNECTED);
    }

    SECTION("Rejected credentials") {
        script_boot(*m.port);
        script_edm_entry(*m.port);
        script_edm_ok(*m.port, "AT+UWSC=0,", false);
        m.port->add_response("AT+UWSCA=0,3", std::vector<std::vector<uint8_t> >{
            at_confirmation("\r\nOK\r\n"),
            at_event("\r\n+UUWLD:0,4\r\n")
        });

        auto connected = adapter.connect("HomeNet", "wrong-pass");
        REQUIRE(connected.error() == NetError::NO_CONNECTION);
        REQUIRE_FALSE(adapter.is_connected());
    }

    SECTION("Invalid SSID") {
        script_boot(*m.port);
        script_edm_entry(*m.port);
        REQUIRE(adapter.connect("").error() == NetError::PARAMETER);
    }
}

TEST_CASE("NetworkAdapter - Connection status follows the link", "[adapter]") {
    auto m = create_driver_with_mocks();
    NetworkAdapter adapter(*m.driver);
    script_bring_up(*m.port);
    REQUIRE(adapter.connect("HomeNet", "secret-pass"));

    SECTION("Link loss") {
        m.port->inject_rx_data(at_event("\r\n+UUWLD:0,2\r\n"));
        m.driver->poll();
        REQUIRE(adapter.connection_status() == ConnectionStatus::DISCONNECTED);
    }

    SECTION("Module restart") {
        m.port->inject_text("\r\n+STARTUP\r\n");
        m.driver->poll();
        REQUIRE(adapter.connection_status() == ConnectionStatus::DISCONNECTED);
        REQUIRE_FALSE(adapter.is_connected());
    }

    SECTION("Disconnect") {
        script_edm_ok(*m.port, "AT+UWSCA=0,4");
        REQUIRE(adapter.disconnect());
        REQUIRE(adapter.connection_status() == ConnectionStatus::DISCONNECTED);
    }
}

TEST_CASE("NetworkAdapter - Host name lookup", "[adapter][dns]") {
    auto m = create_driver_with_mocks();
    NetworkAdapter adapter(*m.driver);

    SECTION("Not connected") {
        REQUIRE(adapter.gethostbyname("example.com").error() == NetError::NO_CONNECTION);
    }

    SECTION("Resolved by the module") {
        REQUIRE(bring_up(m));
        m.port->add_response("AT+UDNSRN", at_confirmation("\r\n+UDNSRN:\"93.184.216.34\"\r\nOK\r\n"));
        auto address = adapter.gethostbyname("example.com");
        REQUIRE(address);
        REQUIRE(address.value() == "93.184.216.34");
    }

    SECTION("Lookup failure maps to DNS_FAILURE") {
        REQUIRE(bring_up(m));
        m.port->add_response("AT+UDNSRN", at_confirmation("\r\nERROR\r\n"));
        REQUIRE(adapter.gethostbyname("nowhere.invalid").error() == NetError::DNS_FAILURE);
    }
}

TEST_CASE("NetworkAdapter - TCP socket round trip", "[adapter][socket]") {
    auto m = create_driver_with_mocks();
    NetworkAdapter adapter(*m.driver);
    REQUIRE(bring_up(m));

    const Endpoint server{{10, 0, 0, 5}, 80};
    script_open(*m.port, server, 1, 3);
    auto opened = adapter.socket_open(SocketProtocol::TCP, "10.0.0.5", 80);
    REQUIRE(opened);
    SocketId id = opened.value();

    REQUIRE(adapter.socket_send(id, as_bytes("GET / HTTP/1.0\r\n\r\n")).value() == 18);
    REQUIRE(adapter.socket_send(id, span<const std::uint8_t>()).value() == 0);

    std::vector<std::uint8_t> buffer(128);
    span<std::uint8_t> out(buffer.data(), buffer.size());
    REQUIRE(adapter.socket_recv(id, out).error() == NetError::WOULD_BLOCK);

    m.port->inject_rx_data(data_event(3, "HTTP/1.0 200 OK\r\n\r\n"));
    auto received = adapter.socket_recv(id, out);
    REQUIRE(received);
    REQUIRE(std::string(buffer.begin(), buffer.begin() + received.value()) == "HTTP/1.0 200 OK\r\n\r\n");

    m.port->inject_rx_data(concat({at_event("\r\n+UUDPD:1\r\n"), disconnect_event(3)}));
    auto eof = adapter.socket_recv(id, out);
    REQUIRE(eof);
    REQUIRE(eof.value() == 0);

    REQUIRE(adapter.socket_close(id));
    REQUIRE(adapter.socket_recv(id, out).error() == NetError::NO_SOCKET);
    REQUIRE(adapter.socket_close(id).error() == NetError::NO_SOCKET);
}

TEST_CASE("NetworkAdapter - Socket open by host name", "[adapter][socket][dns]") {
    auto m = create_driver_with_mocks();
    NetworkAdapter adapter(*m.driver);
    REQUIRE(bring_up(m));

    m.port->add_response("AT+UDNSRN", at_confirmation("\r\n+UDNSRN:\"93.184.216.34\"\r\nOK\r\n"));
    script_open(*m.port, Endpoint{{93, 184, 216, 34}, 443}, 2, 4);

    auto opened = adapter.socket_open(SocketProtocol::TCP, "example.com", 443);
    REQUIRE(opened);
    REQUIRE(m.port->tx_as_string().find("AT+UDCP=\"tcp://93.184.216.34:443/\"") != std::string::npos);
}

TEST_CASE("NetworkAdapter - Socket errors", "[adapter][socket]") {
    auto m = create_driver_with_mocks();
    NetworkAdapter adapter(*m.driver);

    SECTION("Open before connecting") {
        REQUIRE(adapter.socket_open(SocketProtocol::TCP, "10.0.0.5", 80).error() ==
            NetError::NO_CONNECTION);
    }

    SECTION("Unknown socket id") {
        REQUIRE(bring_up(m));
        SocketId bogus{1, 7};
        const std::string payload = "x";
        REQUIRE(adapter.socket_send(bogus, as_bytes(payload)).error() == NetError::NO_SOCKET);
    }

    SECTION("Module refuses the peer") {
        REQUIRE(bring_up(m));
        m.port->add_response("AT+UDCP=", at_confirmation("\r\nERROR\r\n"));
        REQUIRE(adapter.socket_open(SocketProtocol::TCP, "10.0.0.5", 80).error() ==
            NetError::DEVICE_ERROR);
    }
}

#if UBLOX_FEATURE_ASYNC
TEST_CASE("NetworkAdapter - Cooperative API", "[adapter][async]") {
    auto m = create_driver_with_mocks();
    NetworkAdapter adapter(*m.driver);
    REQUIRE(bring_up(m));

    const Endpoint server{{10, 0, 0, 5}, 80};
    script_open(*m.port, server, 1, 3);
    auto opening = adapter.socket_open_async(SocketProtocol::TCP, server);
    REQUIRE_FALSE(opening.ready());
    REQUIRE(to_net_error(opening.result().error()) == NetError::IN_PROGRESS);

    int polls = 0;
    while (!opening.ready() && polls < 100) {
        m.driver->poll();
        ++polls;
    }
    REQUIRE(opening.ready());
    REQUIRE(opening.result());

    script_edm_ok(*m.port, "AT+UDCPC=1");
    auto closing = adapter.socket_close_async(opening.result().value());
    REQUIRE(m.driver->wait(closing, Millis(10000)));
}
#endif
