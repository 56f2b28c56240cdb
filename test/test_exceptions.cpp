/**
 * @file test_exceptions.cpp
 * @brief Unit tests for the driver exception hierarchy
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "../include/exception/ublox_exception.hpp"

using namespace ublox;
using Catch::Matchers::ContainsSubstring;

TEST_CASE("UbloxException - Basic functionality", "[exception]") {
    SECTION("Base exception stores status and context") {
        try {
            throw UbloxException(Status::CLOSED, "SocketRegistry::send");
            REQUIRE(false); // Should not reach here
        } catch (const UbloxException& e) {
            REQUIRE(e.status() == Status::CLOSED);
            REQUIRE(e.context() == "SocketRegistry::send");
            REQUIRE_THAT(e.what(), ContainsSubstring("Connection closed by peer"));
            REQUIRE_THAT(e.what(), ContainsSubstring("SocketRegistry::send"));
        }
    }

    SECTION("Status converts to std::error_code") {
        std::error_code code = make_error_code(Status::TIMEOUT);
        REQUIRE(code.message() == "Timeout");
        REQUIRE(std::string(code.category().name()) == "ublox::Status");
    }
}

TEST_CASE("ProtocolException - Framing and reply errors", "[exception]") {
    SECTION("Is derived from UbloxException") {
        try {
            throw ProtocolException(Status::WBAD_PAYLOAD_ID, "EdmFrame::deserialize");
        } catch (const UbloxException& e) {
            REQUIRE(e.status() == Status::WBAD_PAYLOAD_ID);
            REQUIRE_THAT(e.what(), ContainsSubstring("Bad payload identifier"));
        }
    }
}

TEST_CASE("throw_error - Factory function", "[exception]") {
    SECTION("Framing and reply errors") {
        REQUIRE_THROWS_AS(throw_error(Status::WBAD_END, "test"), ProtocolException);
        REQUIRE_THROWS_AS(throw_error(Status::WINCOMPLETE, "test"), ProtocolException);
        REQUIRE_THROWS_AS(throw_error(Status::PROTOCOL, "test"), ProtocolException);
    }

    SECTION("Device errors") {
        REQUIRE_THROWS_AS(throw_error(Status::DNOT_FOUND, "test"), DeviceException);
        REQUIRE_THROWS_AS(throw_error(Status::DWRITE_ERROR, "test"), DeviceException);
    }

    SECTION("Timeout") {
        REQUIRE_THROWS_AS(throw_error(Status::TIMEOUT, "test"), TimeoutException);
    }

    SECTION("State errors") {
        REQUIRE_THROWS_AS(throw_error(Status::BUSY, "test"), StateException);
        REQUIRE_THROWS_AS(throw_error(Status::NOT_READY, "test"), StateException);
        REQUIRE_THROWS_AS(throw_error(Status::INVALID_HANDLE, "test"), StateException);
        REQUIRE_THROWS_AS(throw_error(Status::RESOURCE_EXHAUSTED, "test"), StateException);
        REQUIRE_THROWS_AS(throw_error(Status::FATAL, "test"), StateException);
    }
}

TEST_CASE("throw_if_error - Conditional throw", "[exception]") {
    REQUIRE_NOTHROW(throw_if_error(Status::SUCCESS, "test"));
    REQUIRE_THROWS_AS(throw_if_error(Status::WBAD_START, "test"), ProtocolException);
}

TEST_CASE("Exception hierarchy - Polymorphic catching", "[exception]") {
    auto throw_and_check = [](Status status) -> std::string {
            try {
                throw_error(status, "test");
                return "no_throw";
            } catch (const ProtocolException&) {
                return "protocol";
            }
            catch (const DeviceException&) {
                return "device";
            }
            catch (const TimeoutException&) {
                return "timeout";
            }
            catch (const StateException&) {
                return "state";
            }
            catch (const UbloxException&) {
                return "base";
            }
        };

    REQUIRE(throw_and_check(Status::WBAD_LENGTH) == "protocol");
    REQUIRE(throw_and_check(Status::DNOT_OPEN) == "device");
    REQUIRE(throw_and_check(Status::TIMEOUT) == "timeout");
    REQUIRE(throw_and_check(Status::BUSY) == "state");
    REQUIRE(throw_and_check(Status::CLOSED) == "base");
    REQUIRE(throw_and_check(Status::UNSUPPORTED) == "base");
}
