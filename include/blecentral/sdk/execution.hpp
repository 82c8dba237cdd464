//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef BLECENTRAL_SDK_EXECUTION_HPP_INCLUDED
#define BLECENTRAL_SDK_EXECUTION_HPP_INCLUDED

#include "blecentral/platform/defines.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <functional>
#include <memory>
#include <utility>
#include <vector>

namespace blecentral
{
namespace sdk
{

/// Internal implementation details.
/// Not supposed to be used directly by the users of the SDK.
///
namespace detail
{

/// Single-assignment result cell shared by a promise and its futures.
///
template <typename Result>
class StateOf final
{
public:
    using Observer = std::function<void(const Result&)>;

    StateOf()                              = default;
    StateOf(StateOf&&)                     = delete;
    StateOf(const StateOf&)                = delete;
    StateOf& operator=(StateOf&&)          = delete;
    StateOf& operator=(const StateOf&)     = delete;
    ~StateOf()                             = default;

    bool completed() const noexcept
    {
        return maybe_result_.has_value();
    }

    const Result* result() const noexcept
    {
        return maybe_result_.has_value() ? &maybe_result_.value() : nullptr;
    }

    /// Settles the cell with the given result.
    ///
    /// @return `false` if the cell has been already settled - the given result is dropped then.
    ///
    bool settle(Result&& result)
    {
        if (maybe_result_.has_value())
        {
            return false;
        }
        maybe_result_.emplace(std::move(result));

        // Observers may register more observers. Those are appended to the list,
        // and so get notified in the registration order too, after the ones already waiting.
        is_notifying_ = true;
        while (!observers_.empty())
        {
            auto observers = std::move(observers_);
            observers_.clear();
            for (auto& observer : observers)
            {
                observer(maybe_result_.value());
            }
        }
        is_notifying_ = false;
        return true;
    }

    void observe(Observer observer)
    {
        CETL_DEBUG_ASSERT(observer, "");

        if (maybe_result_.has_value() && !is_notifying_)
        {
            observer(maybe_result_.value());
            return;
        }
        observers_.push_back(std::move(observer));
    }

private:
    cetl::optional<Result> maybe_result_;
    std::vector<Observer>  observers_;
    bool                   is_notifying_{false};

};  // StateOf

}  // namespace detail

/// Read side of an asynchronous operation result.
///
/// Copies of a future share the same state, so all of them observe the same (single) result.
/// Observers fire exactly once, in registration order; an observer registered after
/// the settlement fires immediately.
///
template <typename Success_, typename Failure_>
class Future final
{
public:
    using Success = Success_;
    using Failure = Failure_;
    using Result  = cetl::variant<Success, Failure>;

    bool completed() const noexcept
    {
        return state_->completed();
    }

    /// Gets the final result.
    ///
    /// @return Pointer to the result, or `nullptr` if the future is still pending.
    ///
    const Result* result() const noexcept
    {
        return state_->result();
    }

    template <typename Receiver>
    void onComplete(Receiver&& receiver) const
    {
        state_->observe(std::forward<Receiver>(receiver));
    }

    template <typename Receiver>
    void onSuccess(Receiver&& receiver) const
    {
        state_->observe([receive = std::forward<Receiver>(receiver)](const Result& result) mutable {
            //
            if (const auto* const success = cetl::get_if<Success>(&result))
            {
                receive(*success);
            }
        });
    }

    template <typename Receiver>
    void onFailure(Receiver&& receiver) const
    {
        state_->observe([receive = std::forward<Receiver>(receiver)](const Result& result) mutable {
            //
            if (const auto* const failure = cetl::get_if<Failure>(&result))
            {
                receive(*failure);
            }
        });
    }

    /// Checks whether both futures share the same result cell.
    ///
    bool isSameAs(const Future& other) const noexcept
    {
        return state_ == other.state_;
    }

private:
    template <typename, typename>
    friend class Promise;

    using State = detail::StateOf<Result>;

    explicit Future(std::shared_ptr<State> state)
        : state_{std::move(state)}
    {
        CETL_DEBUG_ASSERT(state_, "");
    }

    std::shared_ptr<State> state_;

};  // Future

/// Write side of an asynchronous operation result.
///
/// Only the first `success` or `failure` call settles the result;
/// any later one is a silent no-op (reported by the `false` return value).
///
template <typename Success_, typename Failure_>
class Promise final
{
public:
    using Success = Success_;
    using Failure = Failure_;
    using Future  = sdk::Future<Success, Failure>;
    using Result  = typename Future::Result;

    Promise()
        : state_{std::make_shared<State>()}
    {
    }

    Future future() const
    {
        return Future{state_};
    }

    bool completed() const noexcept
    {
        return state_->completed();
    }

    bool success(Success success)
    {
        return state_->settle(Result{std::move(success)});
    }

    bool failure(Failure failure)
    {
        return state_->settle(Result{std::move(failure)});
    }

private:
    using State = typename Future::State;

    std::shared_ptr<State> state_;

};  // Promise

/// Makes an already failed future.
///
template <typename Success, typename Failure>
Future<Success, Failure> makeFailedFuture(Failure failure)
{
    Promise<Success, Failure> promise;
    promise.failure(std::move(failure));
    return promise.future();
}

/// Makes an already succeeded future.
///
template <typename Success, typename Failure>
Future<Success, Failure> makeSucceededFuture(Success success)
{
    Promise<Success, Failure> promise;
    promise.success(std::move(success));
    return promise.future();
}

/// Algorithm that synchronously waits for the future to be settled.
///
/// The executor is spun on the calling thread, so it has to be the executor
/// the future's producers (transport, timeouts) are scheduled on.
///
template <typename Executor, typename Success, typename Failure>
typename Future<Success, Failure>::Result sync_wait(Executor& executor, const Future<Success, Failure>& future)
{
    platform::waitPollingUntil(executor, [&future] { return future.completed(); });

    return *future.result();
}

}  // namespace sdk
}  // namespace blecentral

#endif  // BLECENTRAL_SDK_EXECUTION_HPP_INCLUDED
