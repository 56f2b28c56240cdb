/**
 * @file command_sequence.cpp
 * @brief Ordered AT command script implementation
 * @version 1.0
 * @date 2025-11-18
 */

#include <iostream>

#include "../include/pattern/command_sequence.hpp"

namespace ublox {

    CommandSequence::CommandSequence(CommandChannel& channel, IClock& clock,
        std::vector<AtCommand> commands, RetryPolicy policy)
        : channel_(channel)
        , clock_(clock)
        , commands_(std::move(commands))
        , policy_(policy) {
        if (policy_.max_attempts < 1) {
            policy_.max_attempts = 1;
        }
    }

    bool CommandSequence::poll() {
        if (outcome_) {
            return true;
        }

        if (inflight_) {
            if (!inflight_->ready()) {
                return false;
            }
            auto response = inflight_->result();
            inflight_.reset();
            if (!response) {
                retry_or_fail(response);
                return done();
            }
            responses_.push_back(std::move(response.value()));
            ++index_;
            attempt_ = 0;
        }

        if (index_ >= commands_.size()) {
            finish(Result<std::vector<AtResponse> >::success(std::move(responses_)));
            return true;
        }

        if (retry_at_) {
            if (clock_.now() < *retry_at_) {
                return false;
            }
            retry_at_.reset();
        }

        ++attempt_;
        auto submitted = channel_.submit(commands_[index_]);
        if (!submitted) {
            retry_or_fail(Result<AtResponse>::error(submitted));
            return done();
        }
        inflight_ = submitted.value();
        return false;
    }

    void CommandSequence::retry_or_fail(const Result<AtResponse>& failure) {
        const Status status = failure.error();
        const bool transient = status == Status::BUSY
                               || (status == Status::TIMEOUT && policy_.retry_timeouts);
        if (transient && attempt_ < policy_.max_attempts) {
            retry_at_ = clock_.now() + policy_.delay_after(attempt_);
            return;
        }
        if (transient) {
            std::cerr << "[CHANNEL] " << commands_[index_].text << " gave up after "
                      << attempt_ << " attempt(s)" << std::endl;
        }
        finish(Result<std::vector<AtResponse> >::error(failure,
            "CommandSequence(" + commands_[index_].text + ")"));
    }

    void CommandSequence::abort(Status reason) {
        if (!outcome_) {
            inflight_.reset();
            finish(Result<std::vector<AtResponse> >::error(reason, "CommandSequence::abort"));
        }
    }

    void CommandSequence::finish(Result<std::vector<AtResponse> > outcome) {
        outcome_ = std::move(outcome);
    }

    Result<std::vector<AtResponse> > CommandSequence::result() const {
        if (!outcome_) {
            return Result<std::vector<AtResponse> >::error(Status::IN_PROGRESS,
                "CommandSequence::result");
        }
        return *outcome_;
    }

} // namespace ublox
