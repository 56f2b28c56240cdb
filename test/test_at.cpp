/**
 * @file test_at.cpp
 * @brief Unit tests for AT command helpers, the command catalog and URC parsing
 * @version 1.0
 * @date 2025-11-18
 */

#include <catch2/catch_test_macros.hpp>

#include "../include/at/at_command.hpp"
#include "../include/at/commands.hpp"
#include "../include/at/urc.hpp"

using namespace ublox;

TEST_CASE("AtCommand - Expected response grammar", "[at][command]") {
    SECTION("Prefixed command owns only its information lines") {
        AtCommand cmd = commands::connect_peer(SocketProtocol::TCP, Endpoint{{10, 0, 0, 5}, 80});
        REQUIRE(cmd.expects("+UDCP:1"));
        REQUIRE_FALSE(cmd.expects("+UUDPD:1"));
        REQUIRE_FALSE(cmd.expects("garbage"));
    }

    SECTION("Unprefixed command takes bare lines, never URCs") {
        AtCommand cmd = commands::software_version();
        REQUIRE(cmd.expects("\"2.1.0-017\""));
        REQUIRE_FALSE(cmd.expects("+STARTUP"));
        REQUIRE_FALSE(cmd.expects(""));
    }

    SECTION("Wire form is CR LF terminated") {
        REQUIRE(commands::attention().wire() == "AT\r\n");
    }
}

TEST_CASE("AtResponse - Parameter extraction", "[at][response]") {
    AtResponse response;
    response.lines = {"+UDNSRN:\"93.184.216.34\"", "+OTHER:1,2"};

    REQUIRE(response.line_with("+OTHER").value() == "+OTHER:1,2");
    REQUIRE_FALSE(response.line_with("+MISSING").has_value());

    auto params = response.params("+UDNSRN");
    REQUIRE(params.size() == 1);
    REQUIRE(params[0] == "93.184.216.34");
    REQUIRE(response.params("+MISSING").empty());
}

TEST_CASE("AT text helpers", "[at][helpers]") {
    SECTION("trim") {
        REQUIRE(trim("  OK\r\n") == "OK");
        REQUIRE(trim("\r\n").empty());
    }

    SECTION("split_params keeps commas inside quotes") {
        auto params = split_params("0,\"my,ssid\", 6");
        REQUIRE(params.size() == 3);
        REQUIRE(params[0] == "0");
        REQUIRE(params[1] == "my,ssid");
        REQUIRE(params[2] == "6");
    }

    SECTION("split_params on empty body") {
        REQUIRE(split_params("").empty());
    }

    SECTION("params_after") {
        auto params = params_after("+UUDPD:3", "+UUDPD");
        REQUIRE(params.size() == 1);
        REQUIRE(params[0] == "3");
        REQUIRE(params_after("+UUDPC:3", "+UUDPD").empty());
    }

    SECTION("to_int") {
        REQUIRE(to_int("42") == 42);
        REQUIRE(to_int(" -7 ") == -7);
        REQUIRE_FALSE(to_int("").has_value());
        REQUIRE_FALSE(to_int("4x").has_value());
        REQUIRE_FALSE(to_int("-").has_value());
        REQUIRE_FALSE(to_int("12345678901").has_value());
    }

    SECTION("quote escapes quotes and backslashes") {
        REQUIRE(quote("net") == "\"net\"");
        REQUIRE(quote("a\"b\\c") == "\"a\\\"b\\\\c\"");
    }
}

TEST_CASE("Command catalog - Texts and timeouts", "[at][commands]") {
    const Endpoint remote{{10, 0, 0, 5}, 80};

    REQUIRE(commands::peer_url(SocketProtocol::TCP, remote) == "tcp://10.0.0.5:80/");
    REQUIRE(commands::peer_url(SocketProtocol::UDP, remote) == "udp://10.0.0.5:80/");

    AtCommand open = commands::connect_peer(SocketProtocol::TCP, remote);
    REQUIRE(open.text == "AT+UDCP=\"tcp://10.0.0.5:80/\"");
    REQUIRE(open.response_prefix == "+UDCP");

    REQUIRE(commands::close_peer(3).text == "AT+UDCPC=3");
    REQUIRE(commands::enter_edm().text == "ATO2");
    REQUIRE(commands::enter_edm().switches_to_edm);
    REQUIRE_FALSE(commands::attention().switches_to_edm);

    REQUIRE(commands::wifi_station_config(commands::WSC_SSID, quote("HomeNet")).text ==
        "AT+UWSC=0,2,\"HomeNet\"");
    REQUIRE(commands::wifi_station_action(commands::ACTION_ACTIVATE).text == "AT+UWSCA=0,3");
    REQUIRE(commands::wifi_ap_action(commands::ACTION_DEACTIVATE).text == "AT+UWAPCA=0,4");

    AtCommand dns = commands::resolve_host("example.com");
    REQUIRE(dns.text == "AT+UDNSRN=0,\"example.com\"");
    REQUIRE(dns.response_prefix == "+UDNSRN");
    REQUIRE(dns.timeout > commands::attention().timeout);
}

TEST_CASE("Urc::parse - Catalog matching", "[at][urc]") {
    SECTION("Startup") {
        auto urc = Urc::parse("+STARTUP");
        REQUIRE(urc.has_value());
        REQUIRE(urc->kind == UrcKind::STARTUP);
        REQUIRE(urc->params.empty());
    }

    SECTION("Peer connected with parameters") {
        auto urc = Urc::parse("+UUDPC:1,2,0,192.168.1.50,49152,10.0.0.5,80");
        REQUIRE(urc.has_value());
        REQUIRE(urc->kind == UrcKind::PEER_CONNECTED);
        REQUIRE(urc->int_param(0) == 1);
        REQUIRE(urc->str_param(5) == "10.0.0.5");
        REQUIRE(urc->int_param(6) == 80);
        REQUIRE(urc->int_param(10, 99) == 99);
    }

    SECTION("Peer disconnected") {
        auto urc = Urc::parse("\r\n+UUDPD:4\r\n");
        REQUIRE(urc.has_value());
        REQUIRE(urc->kind == UrcKind::PEER_DISCONNECTED);
        REQUIRE(urc->int_param(0) == 4);
    }

    SECTION("Similar prefixes do not collide") {
        REQUIRE(Urc::parse("+UUWAPU:0")->kind == UrcKind::WIFI_AP_UP);
        REQUIRE(Urc::parse("+UUWAPSTAC:0,A0B1C2D3E4F5")->kind == UrcKind::WIFI_AP_STATION_CONNECTED);
        REQUIRE(Urc::parse("+UUNU:0")->kind == UrcKind::NETWORK_UP);
        REQUIRE(Urc::parse("+UUNERR:1")->kind == UrcKind::NETWORK_ERROR);
    }

    SECTION("Responses and unknown lines are not URCs") {
        REQUIRE_FALSE(Urc::parse("OK").has_value());
        REQUIRE_FALSE(Urc::parse("+UDNSRN:\"10.0.0.5\"").has_value());
        REQUIRE_FALSE(Urc::parse("+UNKNOWN:1").has_value());
        REQUIRE_FALSE(Urc::parse("").has_value());
    }

    SECTION("Peer handle left over from an abandoned connect") {
        auto urc = Urc::parse("+UDCP:9");
        REQUIRE(urc.has_value());
        REQUIRE(urc->kind == UrcKind::LATE_PEER_HANDLE);
        REQUIRE(urc->int_param(0) == 9);
    }
}

TEST_CASE("Urc - WiFi disconnect reason", "[at][urc]") {
    auto urc = Urc::parse("+UUWLD:0,2");
    REQUIRE(urc.has_value());
    REQUIRE(urc->disconnect_reason() == DisconnectReason::OUT_OF_RANGE);
    REQUIRE(disconnect_reason_to_string(urc->disconnect_reason()) == "out of range");

    REQUIRE(Urc::parse("+UUWLD:0,17")->disconnect_reason() == DisconnectReason::UNKNOWN);
    REQUIRE(Urc::parse("+UUWLE:0,1,6")->disconnect_reason() == DisconnectReason::UNKNOWN);
}

TEST_CASE("Urc - Kind names", "[at][urc]") {
    REQUIRE(urc_kind_to_string(UrcKind::PEER_DISCONNECTED) == "+UUDPD");
    REQUIRE(urc_kind_to_string(UrcKind::STARTUP) == "+STARTUP");
}
