/**
 * @file test_socket_registry.cpp
 * @brief Unit tests for socket lifecycle, data transfer and slot reuse
 * @version 1.0
 * @date 2025-11-18
 */

#include <catch2/catch_test_macros.hpp>
#include <string>
#include <vector>

#include "../include/frame/edm_codec.hpp"
#include "test_utils.hpp"

using namespace ublox;
using namespace ublox::test;

namespace {

    const Endpoint WEB_SERVER{{10, 0, 0, 5}, 80};

    Result<SocketId> open_socket(MockedDriver& m, int peer, std::uint8_t channel,
        const Endpoint& remote = WEB_SERVER) {
        script_open(*m.port, remote, peer, channel);
        UbloxDriver& d = *m.driver;
        return d.wait(d.sockets().open(SocketProtocol::TCP, remote), Millis(10000));
    }

    std::string receive_all(UbloxDriver& d, SocketId id) {
        std::string text;
        std::vector<std::uint8_t> buffer(64);
        while (true) {
            auto count = d.sockets().receive(id, span<std::uint8_t>(buffer.data(), buffer.size()));
            if (!count || count.value() == 0) {
                return text;
            }
            text.append(buffer.begin(), buffer.begin() + count.value());
        }
    }

} // namespace

TEST_CASE("SocketRegistry - HTTP exchange", "[socket][integration]") {
    auto m = create_driver_with_mocks();
    UbloxDriver& d = *m.driver;
    REQUIRE(bring_up(m));

    auto opened = open_socket(m, 1, 3);
    REQUIRE(opened);
    SocketId id = opened.value();
    REQUIRE(d.sockets().state(id) == SocketState::OPEN);
    REQUIRE(d.sockets().channel_of(id).value() == 3);
    REQUIRE(d.sockets().remote_of(id).value() == WEB_SERVER);
    REQUIRE(m.port->tx_as_string().find("AT+UDCP=\"tcp://10.0.0.5:80/\"") != std::string::npos);

    const std::string request = "GET / HTTP/1.1\r\nHost: 10.0.0.5\r\n\r\n";
    auto sent = d.sockets().send(id, span<const std::uint8_t>(
        reinterpret_cast<const std::uint8_t*>(request.data()), request.size()));
    REQUIRE(sent);
    REQUIRE(sent.value() == request.size());
    REQUIRE(d.sockets().state(id) == SocketState::DATA_TRANSFER);

    std::vector<std::uint8_t> request_bytes(request.begin(), request.end());
    auto expected = EdmCodec::encode(EdmFrame::data_command(3,
        span<const std::uint8_t>(request_bytes.data(), request_bytes.size())));
    REQUIRE(m.port->get_tx_history().back() == expected.value());

    m.port->inject_rx_data(data_event(3, "HTTP/1.1 200 OK\r\n\r\nhello"));
    d.poll();
    REQUIRE(d.sockets().buffered(id) == 24);
    REQUIRE(receive_all(d, id) == "HTTP/1.1 200 OK\r\n\r\nhello");

    m.port->inject_rx_data(concat({at_event("\r\n+UUDPD:1\r\n"), disconnect_event(3)}));
    d.poll();
    REQUIRE(d.sockets().peer_closed(id));

    std::vector<std::uint8_t> buffer(16);
    auto drained = d.sockets().receive(id, span<std::uint8_t>(buffer.data(), buffer.size()));
    REQUIRE(drained.error() == Status::CLOSED);

    auto after_close = d.sockets().send(id, span<const std::uint8_t>(request_bytes.data(), 4));
    REQUIRE(after_close.error() == Status::CLOSED);

    // Peer already gone: released without a command
    m.port->clear_tx_history();
    REQUIRE(d.wait(d.sockets().close(id), Millis(5000)));
    REQUIRE(m.port->get_tx_history().empty());
    REQUIRE(d.sockets().free_slots() == SocketRegistry::CAPACITY);
}

TEST_CASE("SocketRegistry - Buffered data survives the peer closing", "[socket]") {
    auto m = create_driver_with_mocks();
    UbloxDriver& d = *m.driver;
    REQUIRE(bring_up(m));

    SocketId id = open_socket(m, 2, 4).value();
    m.port->inject_rx_data(concat({data_event(4, "last words"), disconnect_event(4)}));
    d.poll();

    REQUIRE(receive_all(d, id) == "last words");
    std::vector<std::uint8_t> buffer(8);
    REQUIRE(d.sockets().receive(id, span<std::uint8_t>(buffer.data(), buffer.size())).error() ==
        Status::CLOSED);
}

TEST_CASE("SocketRegistry - Active close", "[socket][close]") {
    auto m = create_driver_with_mocks();
    UbloxDriver& d = *m.driver;
    REQUIRE(bring_up(m));
    SocketId id = open_socket(m, 1, 3).value();

    SECTION("Module confirms the close") {
        script_edm_ok(*m.port, "AT+UDCPC=1");
        auto closed = d.wait(d.sockets().close(id), Millis(10000));
        REQUIRE(closed);
        REQUIRE(m.port->count_tx_containing("AT+UDCPC=1") == 1);
    }

    SECTION("Close that times out still releases the slot") {
        auto closed = d.wait(d.sockets().close(id), Millis(20000));
        REQUIRE(closed);
    }

    SECTION("Second close joins the first") {
        script_edm_ok(*m.port, "AT+UDCPC=1");
        auto first = d.sockets().close(id);
        auto second = d.sockets().close(id);
        REQUIRE(d.sockets().state(id) == SocketState::CLOSING);
        REQUIRE(d.wait(first, Millis(10000)));
        REQUIRE(second.ready());
        REQUIRE(m.port->count_tx_containing("AT+UDCPC=1") == 1);
    }

    REQUIRE(d.sockets().state(id) == SocketState::CLOSED);
    REQUIRE(d.sockets().free_slots() == SocketRegistry::CAPACITY);

    std::vector<std::uint8_t> buffer(8);
    auto stale = d.sockets().receive(id, span<std::uint8_t>(buffer.data(), buffer.size()));
    REQUIRE(stale.error() == Status::INVALID_HANDLE);
    REQUIRE(d.sockets().close(id).result().error() == Status::INVALID_HANDLE);
}

TEST_CASE("SocketRegistry - Slot reuse rejects stale ids", "[socket][handle]") {
    auto m = create_driver_with_mocks();
    UbloxDriver& d = *m.driver;
    REQUIRE(bring_up(m));

    SocketId first = open_socket(m, 1, 3).value();
    m.port->inject_rx_data(disconnect_event(3));
    d.poll();
    REQUIRE(d.wait(d.sockets().close(first), Millis(5000)));

    SocketId second = open_socket(m, 2, 5).value();
    REQUIRE(second.slot == first.slot);
    REQUIRE(second != first);

    const std::uint8_t byte = 0x42;
    REQUIRE(d.sockets().send(first, span<const std::uint8_t>(&byte, 1)).error() ==
        Status::INVALID_HANDLE);
    REQUIRE(d.sockets().send(second, span<const std::uint8_t>(&byte, 1)).value() == 1);
}

TEST_CASE("SocketRegistry - Capacity", "[socket][capacity]") {
    auto m = create_driver_with_mocks();
    UbloxDriver& d = *m.driver;
    REQUIRE(bring_up(m));

    std::vector<SocketId> ids;
    for (std::size_t i = 0; i < SocketRegistry::CAPACITY; ++i) {
        auto opened = open_socket(m, static_cast<int>(i + 1), static_cast<std::uint8_t>(i + 1));
        REQUIRE(opened);
        ids.push_back(opened.value());
    }
    REQUIRE(d.sockets().free_slots() == 0);

    SECTION("Each socket owns a distinct channel") {
        for (std::size_t i = 0; i < ids.size(); ++i) {
            for (std::size_t j = i + 1; j < ids.size(); ++j) {
                REQUIRE(d.sockets().channel_of(ids[i]) != d.sockets().channel_of(ids[j]));
            }
        }
    }

    SECTION("Open beyond capacity") {
        m.port->clear_tx_history();
        auto extra = d.sockets().open(SocketProtocol::TCP, WEB_SERVER);
        REQUIRE(extra.ready());
        REQUIRE(extra.result().error() == Status::RESOURCE_EXHAUSTED);
        REQUIRE(m.port->get_tx_history().empty());

        REQUIRE(d.sockets().free_slots() == 0);
        for (std::size_t i = 0; i < ids.size(); ++i) {
            REQUIRE(d.sockets().state(ids[i]) == SocketState::OPEN);
            REQUIRE(d.sockets().channel_of(ids[i]).value() == static_cast<std::uint8_t>(i + 1));
        }
    }

    SECTION("Data is routed by channel") {
        m.port->inject_rx_data(data_event(2, "two"));
        d.poll();
        REQUIRE(d.sockets().buffered(ids[0]) == 0);
        REQUIRE(d.sockets().buffered(ids[1]) == 3);
    }
}

TEST_CASE("SocketRegistry - Open failures", "[socket][open]") {
    auto m = create_driver_with_mocks();
    UbloxDriver& d = *m.driver;

    SECTION("Data path not ready") {
        auto opened = d.sockets().open(SocketProtocol::TCP, WEB_SERVER);
        REQUIRE(opened.ready());
        REQUIRE(opened.result().error() == Status::NOT_READY);
    }

    SECTION("Port zero") {
        REQUIRE(bring_up(m));
        auto opened = d.sockets().open(SocketProtocol::TCP, Endpoint{{10, 0, 0, 5}, 0});
        REQUIRE(opened.result().error() == Status::INVALID_ARGUMENT);
    }

    SECTION("Module refuses the peer") {
        REQUIRE(bring_up(m));
        m.port->add_response("AT+UDCP=", at_confirmation("\r\nERROR\r\n"));
        auto opened = d.wait(d.sockets().open(SocketProtocol::TCP, WEB_SERVER), Millis(10000));
        REQUIRE(opened.error() == Status::PROTOCOL);
        REQUIRE(d.sockets().free_slots() == SocketRegistry::CAPACITY);
    }

    SECTION("No connect event closes the orphan peer") {
        REQUIRE(bring_up(m));
        m.port->add_response("AT+UDCP=", at_confirmation("\r\n+UDCP:7\r\nOK\r\n"));
        script_edm_ok(*m.port, "AT+UDCPC=7");

        auto opened = d.wait(d.sockets().open(SocketProtocol::TCP, WEB_SERVER), Millis(10000));
        REQUIRE(opened.error() == Status::TIMEOUT);
        REQUIRE(d.sockets().free_slots() == SocketRegistry::CAPACITY);

        for (int i = 0; i < 5; ++i) {
            d.poll();
        }
        REQUIRE(m.port->count_tx_containing("AT+UDCPC=7") == 1);
    }

    SECTION("Silent connect is not repeated and its late peer is closed") {
        REQUIRE(bring_up(m));
        script_edm_ok(*m.port, "AT+UDCPC=9");

        auto opened = d.wait(d.sockets().open(SocketProtocol::TCP, WEB_SERVER), Millis(10000));
        REQUIRE(opened.error() == Status::TIMEOUT);
        REQUIRE(m.port->count_tx_containing("AT+UDCP=") == 1);
        REQUIRE(d.sockets().free_slots() == SocketRegistry::CAPACITY);

        m.port->inject_rx_data(at_confirmation("\r\n+UDCP:9\r\nOK\r\n"));
        for (int i = 0; i < 5; ++i) {
            d.poll();
        }
        REQUIRE(m.port->count_tx_containing("AT+UDCPC=9") == 1);
    }

    SECTION("Close while opening is refused") {
        REQUIRE(bring_up(m));
        auto opening = d.sockets().open(SocketProtocol::TCP, WEB_SERVER);
        REQUIRE_FALSE(opening.ready());
        SocketId id{0, 0};
        REQUIRE(d.sockets().state(id) == SocketState::OPENING);
        REQUIRE(d.sockets().close(id).result().error() == Status::BUSY);

        std::vector<std::uint8_t> buffer(8);
        REQUIRE(d.sockets().receive(id, span<std::uint8_t>(buffer.data(), buffer.size())).error() ==
            Status::NOT_READY);
    }
}

TEST_CASE("SocketRegistry - Module reset invalidates every socket", "[socket][reset]") {
    auto m = create_driver_with_mocks();
    UbloxDriver& d = *m.driver;
    REQUIRE(bring_up(m));

    SocketId open = open_socket(m, 1, 3).value();
    auto opening = d.sockets().open(SocketProtocol::TCP, Endpoint{{10, 0, 0, 6}, 443});
    REQUIRE_FALSE(opening.ready());
    REQUIRE(d.sockets().free_slots() == SocketRegistry::CAPACITY - 2);

    m.port->inject_text("\r\n+STARTUP\r\n");
    d.poll();

    REQUIRE(d.sockets().free_slots() == SocketRegistry::CAPACITY);
    REQUIRE(opening.ready());
    REQUIRE(opening.result().error() == Status::NOT_READY);

    const std::uint8_t byte = 0x42;
    REQUIRE(d.sockets().send(open, span<const std::uint8_t>(&byte, 1)).error() ==
        Status::INVALID_HANDLE);
    REQUIRE(d.sockets().state(open) == SocketState::CLOSED);
}

TEST_CASE("SocketRegistry - Queries see a reset before the next poll", "[socket][reset]") {
    auto m = create_driver_with_mocks();
    UbloxDriver& d = *m.driver;
    REQUIRE(bring_up(m));

    SocketId id = open_socket(m, 1, 3).value();
    REQUIRE(d.sockets().free_slots() == SocketRegistry::CAPACITY - 1);

    d.device().reset_cascade("test");

    REQUIRE(d.sockets().state(id) == SocketState::CLOSED);
    REQUIRE(d.sockets().free_slots() == SocketRegistry::CAPACITY);
    REQUIRE_FALSE(d.sockets().channel_of(id).has_value());
    REQUIRE(d.sockets().buffered(id) == 0);
}

TEST_CASE("SocketRegistry - Receive buffer overflow", "[socket][rx]") {
    auto m = create_driver_with_mocks();
    UbloxDriver& d = *m.driver;
    REQUIRE(bring_up(m));
    SocketId id = open_socket(m, 1, 3).value();

    const std::size_t excess = 100;
    const std::size_t offered = features::SOCKET_RX_BUFFER + excess;
    REQUIRE(offered <= MAX_EDM_PAYLOAD - 1);

    m.port->inject_rx_data(data_event(3, std::string(offered, 'x')));
    d.poll();

    REQUIRE(d.sockets().buffered(id) == features::SOCKET_RX_BUFFER);
    REQUIRE(d.statistics().rx_overflow_bytes == excess);
}

TEST_CASE("SocketRegistry - Frames for unknown channels", "[socket][stale]") {
    auto m = create_driver_with_mocks();
    UbloxDriver& d = *m.driver;
    REQUIRE(bring_up(m));

    m.port->inject_rx_data(concat({data_event(9, "ghost"), disconnect_event(9)}));
    d.poll();

    REQUIRE(d.statistics().frames_stale == 2);
    REQUIRE(d.sockets().free_slots() == SocketRegistry::CAPACITY);
}
