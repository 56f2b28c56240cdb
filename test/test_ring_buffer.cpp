/**
 * @file test_ring_buffer.cpp
 * @brief Unit tests for the fixed-capacity socket byte ring
 * @version 1.0
 * @date 2025-11-18
 */

#include <catch2/catch_test_macros.hpp>
#include <string>
#include <vector>

#include "../include/template/ring_buffer.hpp"

using namespace ublox;

namespace {

    std::size_t push_text(RingBuffer<8>& ring, const std::string& text) {
        return ring.push(span<const std::uint8_t>(
            reinterpret_cast<const std::uint8_t*>(text.data()), text.size()));
    }

    std::string pop_text(RingBuffer<8>& ring, std::size_t count) {
        std::vector<std::uint8_t> out(count);
        std::size_t n = ring.pop(span<std::uint8_t>(out.data(), out.size()));
        return std::string(out.begin(), out.begin() + n);
    }

} // namespace

TEST_CASE("RingBuffer - Push and pop", "[ring]") {
    RingBuffer<8> ring;
    REQUIRE(ring.empty());
    REQUIRE(RingBuffer<8>::capacity() == 8);

    REQUIRE(push_text(ring, "abc") == 3);
    REQUIRE(ring.size() == 3);
    REQUIRE(ring.free_space() == 5);
    REQUIRE(pop_text(ring, 2) == "ab");
    REQUIRE(pop_text(ring, 10) == "c");
    REQUIRE(ring.empty());
    REQUIRE(pop_text(ring, 4).empty());
}

TEST_CASE("RingBuffer - Partial accept when full", "[ring]") {
    RingBuffer<8> ring;
    REQUIRE(push_text(ring, "0123456789") == 8);
    REQUIRE(ring.full());
    REQUIRE(push_text(ring, "x") == 0);
    REQUIRE(pop_text(ring, 8) == "01234567");
}

TEST_CASE("RingBuffer - Wraps around the end of storage", "[ring]") {
    RingBuffer<8> ring;
    push_text(ring, "abcdef");
    REQUIRE(pop_text(ring, 5) == "abcde");
    REQUIRE(push_text(ring, "ghijklm") == 7);
    REQUIRE(ring.full());
    REQUIRE(pop_text(ring, 8) == "fghijklm");
}

TEST_CASE("RingBuffer - Peek then consume", "[ring]") {
    RingBuffer<8> ring;
    push_text(ring, "hello");

    std::vector<std::uint8_t> out(3);
    REQUIRE(ring.peek(span<std::uint8_t>(out.data(), out.size())) == 3);
    REQUIRE(ring.size() == 5);
    REQUIRE(std::string(out.begin(), out.end()) == "hel");

    REQUIRE(ring.consume(3) == 3);
    REQUIRE(ring.consume(10) == 2);
    REQUIRE(ring.empty());

    push_text(ring, "x");
    ring.clear();
    REQUIRE(ring.empty());
}
