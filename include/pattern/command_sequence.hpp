/**
 * @file command_sequence.hpp
 * @brief Ordered AT command script advanced from the poll loop
 * @version 1.0
 * @date 2025-11-18
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include <algorithm>
#include <optional>
#include <vector>

#include "command_channel.hpp"

namespace ublox {

    /**
     * @brief Bounded retry for transient command failures (BUSY, TIMEOUT)
     */
    struct RetryPolicy {
        int max_attempts = 3;
        Millis backoff{100};
        bool exponential = false;   ///< Double the backoff after every failed attempt
        bool retry_timeouts = true; ///< False for commands the module must not see twice

        Millis delay_after(int attempt) const {
            if (!exponential || attempt <= 1) {
                return backoff;
            }
            return backoff * (1LL << std::min(attempt - 1, 16));
        }
    };

    /**
     * @brief Runs commands one after another through the shared command slot
     *
     * A command failing with BUSY (slot taken by another caller) or TIMEOUT is
     * retried after the policy's backoff until its attempts are spent. TIMEOUT
     * is final when the policy disables retry_timeouts. Any other failure ends
     * the sequence with that error.
     */
    class CommandSequence {
        public:
            CommandSequence(CommandChannel& channel, IClock& clock,
                std::vector<AtCommand> commands, RetryPolicy policy = RetryPolicy{});

            /**
             * @brief Advance the script
             * @return true once the sequence finished (successfully or not)
             */
            bool poll();

            bool done() const { return outcome_.has_value(); }

            /// Responses in command order, or the error that stopped the script
            Result<std::vector<AtResponse> > result() const;

            /// Index of the command being executed
            std::size_t step() const { return index_; }

            /// Stop retrying and finish with reason (reset cascade)
            void abort(Status reason);

        private:
            CommandChannel& channel_;
            IClock& clock_;
            std::vector<AtCommand> commands_;
            RetryPolicy policy_;

            std::size_t index_ = 0;
            int attempt_ = 0;
            std::optional<Pending<AtResponse> > inflight_;
            std::optional<TimePoint> retry_at_;
            std::vector<AtResponse> responses_;
            std::optional<Result<std::vector<AtResponse> > > outcome_;

            void retry_or_fail(const Result<AtResponse>& failure);
            void finish(Result<std::vector<AtResponse> > outcome);
    };

} // namespace ublox
