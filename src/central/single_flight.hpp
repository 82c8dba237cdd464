//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef BLECENTRAL_CENTRAL_SINGLE_FLIGHT_HPP_INCLUDED
#define BLECENTRAL_CENTRAL_SINGLE_FLIGHT_HPP_INCLUDED

#include "generation_guard.hpp"

#include "logging.hpp"
#include "serial_queue.hpp"

#include <blecentral/sdk/discovery.hpp>
#include <blecentral/sdk/errors.hpp>
#include <blecentral/sdk/execution.hpp>
#include <blecentral/sdk/transport.hpp>

#include <cetl/pf17/cetlpf.hpp>
#include <libcyphal/types.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <utility>

namespace blecentral
{
namespace central
{

/// Turns one kind of event-driven transport exchange of a single owner
/// into a single-shot, timeout-bounded operation with exactly-once completion.
///
/// Several sources compete to settle a round: the transport completion, the timeout, the disconnection
/// and the owner going away. Whichever comes first wins; the others find the round settled and do nothing.
/// A round started while another one is pending is coalesced into the pending one.
///
/// An unsettled round fails with `UnconfiguredError` when the flight is destroyed.
///
/// All methods must be called from the owner's serialization domain (see `common::SerialQueue`).
///
template <typename Success, typename Failure, typename TimeoutError>
class SingleFlight final
{
public:
    using Future  = sdk::Future<Success, Failure>;
    using Promise = sdk::Promise<Success, Failure>;

    SingleFlight(std::string owner_name, std::string operation)
        : state_{std::make_shared<State>(std::move(owner_name), std::move(operation))}
    {
    }

    SingleFlight(SingleFlight&&)                 = delete;
    SingleFlight(const SingleFlight&)            = delete;
    SingleFlight& operator=(SingleFlight&&)      = delete;
    SingleFlight& operator=(const SingleFlight&) = delete;

    ~SingleFlight()
    {
        abandon();
    }

    /// Gets future of the pending (not yet settled) round, if any.
    ///
    cetl::optional<Future> pendingFuture() const
    {
        if (isPending())
        {
            return state_->pending->future();
        }
        return cetl::nullopt;
    }

    bool isPending() const noexcept
    {
        return state_->pending.has_value() && !state_->pending->completed();
    }

    GenerationGuard::Generation generation() const noexcept
    {
        return state_->generation.current();
    }

    const std::string& ownerName() const noexcept
    {
        return state_->owner_name;
    }

    /// Starts a new round (or joins the pending one).
    ///
    /// @param queue Serialization domain where the timeout is scheduled.
    /// @param connection_state Current state of the owner's connection.
    /// @param timeout Round timeout; `sdk::InfiniteTimeout` disables it.
    /// @param issue_request Issues the transport request of the new round.
    ///                      Not called if the round is coalesced or fails fast.
    ///
    template <typename IssueRequest>
    Future start(common::SerialQueue&            queue,
                 const sdk::ConnectionState      connection_state,
                 const std::chrono::microseconds timeout,
                 IssueRequest&&                  issue_request)
    {
        State& state = *state_;

        if (auto pending = pendingFuture())
        {
            state.logger->debug("{}: joining pending {} (gen={}).",
                                state.owner_name,
                                state.operation,
                                state.generation.current());
            return *pending;
        }

        if (connection_state != sdk::ConnectionState::Connected)
        {
            state.logger->debug("{}: can't start {} - not connected (state={}).",
                                state.owner_name,
                                state.operation,
                                connection_state);
            return sdk::makeFailedFuture<Success, Failure>(Failure{sdk::NotConnectedError{}});
        }

        const auto generation = state.generation.advance();
        state.pending.emplace();
        auto future = state.pending->future();

        state.logger->debug("{}: {} started (gen={}, timeout={}).",
                            state.owner_name,
                            state.operation,
                            generation,
                            describeTimeout(timeout));

        if (timeout != sdk::InfiniteTimeout)
        {
            armTimeout(queue, generation, timeout);
        }

        std::forward<IssueRequest>(issue_request)();
        return future;
    }

    /// Succeeds the pending round.
    ///
    /// @return `false` if there was no pending round.
    ///
    bool succeed(Success success)
    {
        if (!isPending())
        {
            return false;
        }
        // Observers may start a new round (which replaces `pending`), so settle a copy of the promise.
        auto promise = *state_->pending;
        promise.success(std::move(success));
        return true;
    }

    /// Fails the pending round.
    ///
    /// @return `false` if there was no pending round.
    ///
    bool fail(Failure failure)
    {
        if (!isPending())
        {
            return false;
        }
        auto promise = *state_->pending;
        promise.failure(std::move(failure));
        return true;
    }

    /// Fails the pending round (if any) because the connection has dropped.
    ///
    void onDisconnect(const cetl::optional<int>& error)
    {
        const State& state = *state_;
        if (isPending())
        {
            state.logger->info("{}: {} aborted by disconnection (gen={}, err={}).",
                               state.owner_name,
                               state.operation,
                               state.generation.current(),
                               error.value_or(0));
        }
        fail(Failure{sdk::DisconnectedError{}});
    }

    /// Fails the pending round (if any) because its owner is detached from the connection.
    ///
    void abandon()
    {
        const State& state = *state_;
        if (isPending())
        {
            state.logger->info("{}: {} abandoned (gen={}).",
                               state.owner_name,
                               state.operation,
                               state.generation.current());
        }
        fail(Failure{sdk::UnconfiguredError{}});
    }

private:
    struct State
    {
        State(std::string name, std::string operation_name)
            : owner_name{std::move(name)}
            , operation{std::move(operation_name)}
            , logger{common::getLogger(common::LoggerNames::Central)}
        {
        }

        const std::string       owner_name;
        const std::string       operation;
        common::LoggerPtr       logger;
        cetl::optional<Promise> pending;
        GenerationGuard         generation;
    };

    static std::string describeTimeout(const std::chrono::microseconds timeout)
    {
        if (timeout == sdk::InfiniteTimeout)
        {
            return "inf";
        }
        return fmt::format("{}ms", std::chrono::duration_cast<std::chrono::milliseconds>(timeout).count());
    }

    void armTimeout(common::SerialQueue&              queue,
                    const GenerationGuard::Generation generation,
                    const std::chrono::microseconds   timeout)
    {
        // The queue may outlive the flight, hence the weak reference.
        std::weak_ptr<State> weak_state = state_;

        queue.delay(std::chrono::duration_cast<libcyphal::Duration>(timeout), [weak_state, generation] {
            //
            const auto state = weak_state.lock();
            if (!state)
            {
                return;
            }
            if (!state->generation.isCurrent(generation) || !state->pending.has_value() ||
                state->pending->completed())
            {
                state->logger->debug("{}: stale {} timeout is ignored (gen={}, current_gen={}).",
                                     state->owner_name,
                                     state->operation,
                                     generation,
                                     state->generation.current());
                return;
            }

            state->logger->warn("{}: {} timed out (gen={}).", state->owner_name, state->operation, generation);
            auto promise = *state->pending;
            promise.failure(Failure{TimeoutError{}});
        });
    }

    std::shared_ptr<State> state_;

};  // SingleFlight

}  // namespace central
}  // namespace blecentral

#endif  // BLECENTRAL_CENTRAL_SINGLE_FLIGHT_HPP_INCLUDED
