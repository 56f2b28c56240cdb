/**
 * @file reset_broadcast.hpp
 * @brief Device reset epoch observed by every component holding module state
 * @version 1.0
 * @date 2025-11-18
 *
 * The device state machine signals a reset by bumping the epoch. The command
 * channel and the socket registry compare the epoch against the last one they
 * saw on every poll and public call, and invalidate their own state when it
 * moved. Signalling is therefore safe from inside the receive path.
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include <cstdint>

namespace ublox {

    class ResetBroadcast {
        private:
            std::uint32_t epoch_ = 0;

        public:
            void signal() {
                ++epoch_;
            }

            std::uint32_t epoch() const {
                return epoch_;
            }
    };

    /**
     * @brief Per-component view of the reset epoch
     */
    class ResetObserver {
        private:
            const ResetBroadcast& broadcast_;
            std::uint32_t seen_;

        public:
            explicit ResetObserver(const ResetBroadcast& broadcast)
                : broadcast_(broadcast), seen_(broadcast.epoch()) {}

            /**
             * @return true once per reset that happened since the last call
             */
            bool observe() {
                if (broadcast_.epoch() == seen_) {
                    return false;
                }
                seen_ = broadcast_.epoch();
                return true;
            }

            /// A reset happened that observe() has not consumed yet
            bool pending() const {
                return broadcast_.epoch() != seen_;
            }
    };

} // namespace ublox
