//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "disconnect_notifier.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <utility>
#include <vector>

namespace blecentral
{
namespace central
{

// MARK: - Subscription

DisconnectNotifier::Subscription::Subscription(Subscription&& other) noexcept
    : handlers_{std::move(other.handlers_)}
    , id_{other.id_}
{
    other.handlers_.reset();
}

DisconnectNotifier::Subscription& DisconnectNotifier::Subscription::operator=(Subscription&& other) noexcept
{
    if (this != &other)
    {
        reset();
        handlers_ = std::move(other.handlers_);
        id_       = other.id_;
        other.handlers_.reset();
    }
    return *this;
}

void DisconnectNotifier::Subscription::reset() noexcept
{
    if (const auto handlers = handlers_.lock())
    {
        handlers->id_to_handler.erase(id_);
    }
    handlers_.reset();
}

// MARK: - DisconnectNotifier

DisconnectNotifier::DisconnectNotifier()
    : handlers_{std::make_shared<Handlers>()}
{
}

DisconnectNotifier::Subscription DisconnectNotifier::subscribe(Handler handler)
{
    CETL_DEBUG_ASSERT(handler, "");

    const auto id = handlers_->next_id++;
    handlers_->id_to_handler.emplace(id, std::move(handler));
    return Subscription{handlers_, id};
}

void DisconnectNotifier::notify(const cetl::optional<int>& error)
{
    // Snapshot of ids, so that (un)subscriptions made by handlers don't invalidate the iteration.
    std::vector<std::uint64_t> ids;
    ids.reserve(handlers_->id_to_handler.size());
    for (const auto& id_and_handler : handlers_->id_to_handler)
    {
        ids.push_back(id_and_handler.first);
    }

    const auto handlers = handlers_;
    for (const auto id : ids)
    {
        const auto it = handlers->id_to_handler.find(id);
        if (it == handlers->id_to_handler.end())
        {
            continue;
        }

        // Copy, so that the handler may safely unsubscribe itself.
        const auto handler = it->second;
        handler(error);
    }
}

std::size_t DisconnectNotifier::subscribersCount() const noexcept
{
    return handlers_->id_to_handler.size();
}

}  // namespace central
}  // namespace blecentral
