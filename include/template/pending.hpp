/**
 * @file pending.hpp
 * @brief "Operation in flight" marker shared by the blocking and async APIs
 * @version 1.0
 * @date 2025-11-18
 * @copyright Copyright (c) 2025
 */

#pragma once

#include <memory>
#include <optional>
#include <utility>

#include "result.hpp"

namespace ublox {

/**
 * @brief Handle to an operation advanced by the driver poll loop.
 *
 * The component that starts an operation keeps one copy and resolves it once;
 * the caller keeps another and checks ready(). Both copies share state, so either
 * side may go away first. A caller that stops waiting calls abandon(): the
 * operation still runs to completion internally and its outcome is discarded.
 *
 * @tparam T Value produced on success (void for none)
 */
    template<typename T>
    class Pending {
        private:
            struct State {
                std::optional<Result<T> > outcome;
                bool abandoned = false;
            };
            std::shared_ptr<State> state_;

        public:
            Pending() : state_(std::make_shared<State>()) {}

            static Pending resolved(Result<T> outcome) {
                Pending p;
                p.resolve(std::move(outcome));
                return p;
            }

            bool ready() const {
                return state_->outcome.has_value();
            }

            bool abandoned() const {
                return state_->abandoned;
            }

            void abandon() {
                state_->abandoned = true;
            }

            /**
             * @brief Outcome of the operation, or IN_PROGRESS while in flight
             */
            Result<T> result() const {
                if (!state_->outcome) {
                    return Result<T>::error(Status::IN_PROGRESS, "Pending::result");
                }
                return *state_->outcome;
            }

            /**
             * @brief Complete the operation. Later calls are ignored.
             */
            void resolve(Result<T> outcome) const {
                if (state_->outcome) return;
                state_->outcome = std::move(outcome);
            }
    };

} // namespace ublox
