/**
 * @file mock_clock.hpp
 * @brief Virtual time source for deterministic timeout tests
 * @version 1.0
 * @date 2025-11-18
 */

#pragma once

#include "../../include/io/clock.hpp"

namespace ublox {
    namespace test {

        /**
         * @brief Clock that only moves when told to
         *
         * sleep_for() advances virtual time instead of blocking, so blocking
         * driver calls run through their timeouts instantly.
         */
        class MockClock : public IClock {
            public:
                TimePoint now() const override {
                    return now_;
                }

                void sleep_for(Millis duration) override {
                    now_ += duration;
                    ++sleeps_;
                }

                void advance(Millis duration) {
                    now_ += duration;
                }

                std::size_t sleep_count() const {
                    return sleeps_;
                }

            private:
                TimePoint now_{std::chrono::hours(1)};
                std::size_t sleeps_ = 0;
        };

    } // namespace test
} // namespace ublox
