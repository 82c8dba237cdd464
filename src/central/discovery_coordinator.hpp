//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef BLECENTRAL_CENTRAL_DISCOVERY_COORDINATOR_HPP_INCLUDED
#define BLECENTRAL_CENTRAL_DISCOVERY_COORDINATOR_HPP_INCLUDED

#include "generation_guard.hpp"
#include "resource_registry.hpp"
#include "single_flight.hpp"

#include "logging.hpp"
#include "serial_queue.hpp"

#include <blecentral/sdk/discovery.hpp>
#include <blecentral/sdk/errors.hpp>
#include <blecentral/sdk/transport.hpp>
#include <blecentral/sdk/uuid.hpp>

#include <cetl/pf17/cetlpf.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace blecentral
{
namespace central
{

/// Turns the event-driven "discover sub-resources" transport exchange of a single owner
/// into a single-shot, timeout-bounded operation with exactly-once completion (see `SingleFlight`),
/// and keeps track of the resources reported by the most recent round.
///
/// Destroying the coordinator fails its unsettled round with `UnconfiguredError`.
///
/// All methods must be called from the owner's serialization domain (see `common::SerialQueue`).
///
template <typename Resource>
class DiscoveryCoordinator final
{
public:
    using Registry    = ResourceRegistry<Resource>;
    using ResourcePtr = typename Registry::ResourcePtr;

    explicit DiscoveryCoordinator(std::string owner_name)
        : logger_{common::getLogger(common::LoggerNames::Central)}
        , flight_{std::move(owner_name), "discovery"}
    {
    }

    DiscoveryCoordinator(DiscoveryCoordinator&&)                 = delete;
    DiscoveryCoordinator(const DiscoveryCoordinator&)            = delete;
    DiscoveryCoordinator& operator=(DiscoveryCoordinator&&)      = delete;
    DiscoveryCoordinator& operator=(const DiscoveryCoordinator&) = delete;

    ~DiscoveryCoordinator() = default;

    /// Gets future of the pending (not yet settled) round, if any.
    ///
    cetl::optional<sdk::Discovery::Future> pendingFuture() const
    {
        return flight_.pendingFuture();
    }

    bool isPending() const noexcept
    {
        return flight_.isPending();
    }

    /// Starts a new discovery round (or joins the pending one).
    ///
    /// Identifiers of the previous round are forgotten only when a new round is actually issued.
    ///
    /// @param queue Serialization domain where the timeout is scheduled.
    /// @param connection_state Current state of the owner's connection.
    /// @param timeout Round timeout; `sdk::InfiniteTimeout` disables it.
    /// @param issue_request Issues the transport request of the new round.
    ///                      Not called if the round is coalesced or fails fast.
    ///
    template <typename IssueRequest>
    sdk::Discovery::Future discover(common::SerialQueue&            queue,
                                    const sdk::ConnectionState      connection_state,
                                    const std::chrono::microseconds timeout,
                                    IssueRequest&&                  issue_request)
    {
        return flight_.start(queue, connection_state, timeout, [this, &issue_request] {
            //
            round_ids_.clear();
            issue_request();
        });
    }

    /// Handles completion of the transport request.
    ///
    /// Identifiers of the previous round are forgotten first. On error, reported items are dropped
    /// (and never even constructed), and the pending round (if any) fails with the transport error.
    /// Otherwise every reported item is upserted into the registry, and the pending round (if any) succeeds.
    ///
    /// @param make_resource Functor which makes a resource (as `std::shared_ptr<Resource>`) from a raw item.
    /// @return Resources which the upserts have replaced. The registry doesn't know them anymore,
    ///         so the caller is the one to detach them from the connection.
    ///
    template <typename RawItem, typename MakeResource>
    std::vector<ResourcePtr> onDiscoveryComplete(const std::vector<RawItem>& raw_items,
                                                 const cetl::optional<int>&  error,
                                                 Registry&                   registry,
                                                 MakeResource&&              make_resource)
    {
        round_ids_.clear();

        if (error)
        {
            for (const auto& raw_item : raw_items)
            {
                logger_->warn("{}: discarding '{}' reported along with error (err={}).",
                              flight_.ownerName(),
                              raw_item.uuid,
                              *error);
            }
            logger_->warn("{}: discovery failed (gen={}, err={}).", flight_.ownerName(), flight_.generation(), *error);
            flight_.fail(sdk::Discovery::Failure{sdk::TransportError{*error}});
            return {};
        }

        std::vector<ResourcePtr> replaced;
        for (const auto& raw_item : raw_items)
        {
            if (auto previous = registry.upsert(raw_item.uuid, make_resource(raw_item)))
            {
                replaced.push_back(std::move(previous));
            }
            round_ids_.insert(raw_item.uuid);
        }
        logger_->debug("{}: discovered {} item(s) (gen={}, replaced={}).",
                       flight_.ownerName(),
                       raw_items.size(),
                       flight_.generation(),
                       replaced.size());
        flight_.succeed(sdk::Discovery::Success{});
        return replaced;
    }

    /// Fails the pending round (if any) because the connection has dropped.
    /// Already discovered resources stay in the registry.
    ///
    void onDisconnect(const cetl::optional<int>& error)
    {
        flight_.onDisconnect(error);
    }

    /// Fails the pending round (if any) with `UnconfiguredError`.
    ///
    void abandon()
    {
        flight_.abandon();
    }

    /// Enumerates resources of the most recent round (in the registry's natural order).
    ///
    std::vector<ResourcePtr> resources(const Registry& registry) const
    {
        return registry.enumerate(round_ids_);
    }

    const IdentifierSet& roundIds() const noexcept
    {
        return round_ids_;
    }

    GenerationGuard::Generation generation() const noexcept
    {
        return flight_.generation();
    }

private:
    using Flight = SingleFlight<sdk::Discovery::Success, sdk::Discovery::Failure, sdk::DiscoveryTimeoutError>;

    common::LoggerPtr logger_;
    IdentifierSet     round_ids_;
    // Declared last, so that observers of the round it abandons still see the identifiers.
    Flight flight_;

};  // DiscoveryCoordinator

}  // namespace central
}  // namespace blecentral

#endif  // BLECENTRAL_CENTRAL_DISCOVERY_COORDINATOR_HPP_INCLUDED
