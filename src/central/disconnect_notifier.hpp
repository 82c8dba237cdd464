//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef BLECENTRAL_CENTRAL_DISCONNECT_NOTIFIER_HPP_INCLUDED
#define BLECENTRAL_CENTRAL_DISCONNECT_NOTIFIER_HPP_INCLUDED

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>

namespace blecentral
{
namespace central
{

/// Fans a connection drop out to every discovery owner living on the connection.
///
/// Handlers are notified in subscription order. A handler may subscribe or unsubscribe
/// (itself or others) while being notified - unsubscribed handlers are not called anymore,
/// and new subscribers don't get the ongoing notification.
///
class DisconnectNotifier final
{
    struct Handlers;

public:
    using Handler = std::function<void(const cetl::optional<int>& error)>;

    /// RAII handle of a subscription. Destroying (or resetting) it unsubscribes the handler.
    ///
    class Subscription final
    {
    public:
        Subscription() = default;

        Subscription(Subscription&& other) noexcept;
        Subscription& operator=(Subscription&& other) noexcept;

        Subscription(const Subscription&)            = delete;
        Subscription& operator=(const Subscription&) = delete;

        ~Subscription()
        {
            reset();
        }

        void reset() noexcept;

        bool isActive() const noexcept
        {
            return !handlers_.expired();
        }

    private:
        friend class DisconnectNotifier;

        Subscription(const std::shared_ptr<Handlers>& handlers, const std::uint64_t id)
            : handlers_{handlers}
            , id_{id}
        {
        }

        std::weak_ptr<Handlers> handlers_;
        std::uint64_t           id_{0};

    };  // Subscription

    DisconnectNotifier();

    DisconnectNotifier(DisconnectNotifier&&)                 = delete;
    DisconnectNotifier(const DisconnectNotifier&)            = delete;
    DisconnectNotifier& operator=(DisconnectNotifier&&)      = delete;
    DisconnectNotifier& operator=(const DisconnectNotifier&) = delete;

    ~DisconnectNotifier() = default;

    CETL_NODISCARD Subscription subscribe(Handler handler);

    void notify(const cetl::optional<int>& error);

    std::size_t subscribersCount() const noexcept;

private:
    struct Handlers
    {
        std::uint64_t                     next_id{1};
        std::map<std::uint64_t, Handler> id_to_handler;
    };

    std::shared_ptr<Handlers> handlers_;

};  // DisconnectNotifier

}  // namespace central
}  // namespace blecentral

#endif  // BLECENTRAL_CENTRAL_DISCONNECT_NOTIFIER_HPP_INCLUDED
