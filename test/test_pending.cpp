/**
 * @file test_pending.cpp
 * @brief Unit tests for Result error chains and Pending markers
 * @version 1.0
 * @date 2025-11-18
 */

#include <catch2/catch_test_macros.hpp>
#include <string>

#include "../include/template/pending.hpp"
#include "../include/enums/net_error.hpp"

using namespace ublox;

TEST_CASE("Result - Error chain", "[result]") {
    auto inner = Result<int>::error(Status::TIMEOUT, "CommandChannel::poll");
    auto outer = Result<std::string>::error(inner, "SocketRegistry::open");

    REQUIRE(outer.fail());
    REQUIRE(outer.error() == Status::TIMEOUT);
    REQUIRE(outer.error_chain().size() == 2);
    REQUIRE(outer.describe() == "Error: Timeout [CommandChannel::poll -> SocketRegistry::open]");

    auto ok = Result<int>::success(7);
    REQUIRE(ok);
    REQUIRE(ok.value() == 7);
    REQUIRE(ok.describe() == "Success");
    REQUIRE(Result<int>::error(Status::BUSY).value_or(3) == 3);
}

TEST_CASE("Result - NetError vocabulary", "[result]") {
    auto failed = Result<std::size_t, NetError>::error(NetError::WOULD_BLOCK, "socket_recv");
    REQUIRE(failed.error() == NetError::WOULD_BLOCK);
    REQUIRE(failed.describe().find("Would block") != std::string::npos);

    auto done = Result<void, NetError>::success();
    REQUIRE(done);
}

TEST_CASE("Pending - Resolution", "[pending]") {
    Pending<int> pending;
    REQUIRE_FALSE(pending.ready());
    REQUIRE(pending.result().error() == Status::IN_PROGRESS);

    SECTION("Copies share the outcome") {
        Pending<int> copy = pending;
        pending.resolve(Result<int>::success(42));
        REQUIRE(copy.ready());
        REQUIRE(copy.result().value() == 42);
    }

    SECTION("First resolution wins") {
        pending.resolve(Result<int>::error(Status::FATAL, "reset"));
        pending.resolve(Result<int>::success(1));
        REQUIRE(pending.result().error() == Status::FATAL);
    }

    SECTION("Abandoned marker still resolves") {
        pending.abandon();
        REQUIRE(pending.abandoned());
        pending.resolve(Result<int>::success(5));
        REQUIRE(pending.ready());
    }
}

TEST_CASE("Pending - Already resolved", "[pending]") {
    auto done = Pending<void>::resolved(Result<void>::success());
    REQUIRE(done.ready());
    REQUIRE(done.result());
}
