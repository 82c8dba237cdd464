//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef BLECENTRAL_SDK_DISCOVERY_HPP_INCLUDED
#define BLECENTRAL_SDK_DISCOVERY_HPP_INCLUDED

#include "errors.hpp"
#include "execution.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <chrono>

namespace blecentral
{
namespace sdk
{

/// Timeout value which disables the discovery timeout.
///
constexpr std::chrono::microseconds InfiniteTimeout = std::chrono::microseconds::max();

/// Defines the result types of a discovery round.
///
/// Discovery has no value of its own - on success, discovered resources are available
/// from the owner (see `Peripheral::services` and `Service::characteristics`).
///
struct Discovery final
{
    using Success = cetl::monostate;
    using Failure = DiscoveryFailure;
    using Result  = cetl::variant<Success, Failure>;
    using Future  = sdk::Future<Success, Failure>;
    using Promise = sdk::Promise<Success, Failure>;

};  // Discovery

}  // namespace sdk
}  // namespace blecentral

#endif  // BLECENTRAL_SDK_DISCOVERY_HPP_INCLUDED
