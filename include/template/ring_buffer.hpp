/**
 * @file ring_buffer.hpp
 * @brief Fixed-capacity byte queue used for per-socket buffering
 * @version 1.0
 * @date 2025-11-18
 * @copyright Copyright (c) 2025
 */

#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <boost/core/span.hpp>

using namespace boost;

namespace ublox {

/**
 * @brief Bounded FIFO of bytes with storage sized at compile time.
 *
 * push() accepts as many bytes as fit and reports how many were taken,
 * pop() drains up to the destination size. Neither allocates.
 *
 * @tparam N Capacity in bytes
 */
    template<std::size_t N>
    class RingBuffer {
        static_assert(N > 0, "RingBuffer capacity must be non-zero");

        private:
            std::array<std::uint8_t, N> storage_{};
            std::size_t head_ = 0;  // next byte to read
            std::size_t size_ = 0;

        public:
            static constexpr std::size_t capacity() { return N; }

            std::size_t size() const { return size_; }
            std::size_t free_space() const { return N - size_; }
            bool empty() const { return size_ == 0; }
            bool full() const { return size_ == N; }

            void clear() {
                head_ = 0;
                size_ = 0;
            }

            /**
             * @return Number of bytes accepted, possibly fewer than data.size()
             */
            std::size_t push(span<const std::uint8_t> data) {
                std::size_t accepted = std::min(data.size(), free_space());
                std::size_t tail = (head_ + size_) % N;
                for (std::size_t i = 0; i < accepted; ++i) {
                    storage_[tail] = data[i];
                    tail = (tail + 1) % N;
                }
                size_ += accepted;
                return accepted;
            }

            /**
             * @brief Copy up to out.size() bytes without consuming them
             */
            std::size_t peek(span<std::uint8_t> out) const {
                std::size_t count = std::min(out.size(), size_);
                for (std::size_t i = 0; i < count; ++i) {
                    out[i] = storage_[(head_ + i) % N];
                }
                return count;
            }

            std::size_t consume(std::size_t count) {
                count = std::min(count, size_);
                head_ = (head_ + count) % N;
                size_ -= count;
                if (size_ == 0) {
                    head_ = 0;
                }
                return count;
            }

            std::size_t pop(span<std::uint8_t> out) {
                return consume(peek(out));
            }
    };

} // namespace ublox
