/**
 * @file clock.hpp
 * @brief Time source used for every timeout, backoff and settle delay
 * @version 1.0
 * @date 2025-11-18
 */

#pragma once

#include <chrono>
#include <thread>

namespace ublox {

    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Millis = std::chrono::milliseconds;

    /**
     * @brief Injectable monotonic clock
     *
     * The driver never reads the system clock directly, so tests can run
     * timeouts against virtual time.
     */
    class IClock {
        public:
            virtual ~IClock() = default;

            virtual TimePoint now() const = 0;

            /**
             * @brief Yield between polls of a blocking wait
             */
            virtual void sleep_for(Millis duration) = 0;
    };

    class SteadyClock : public IClock {
        public:
            TimePoint now() const override {
                return Clock::now();
            }

            void sleep_for(Millis duration) override {
                std::this_thread::sleep_for(duration);
            }
    };

} // namespace ublox
