//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef BLECENTRAL_CENTRAL_GENERATION_GUARD_HPP_INCLUDED
#define BLECENTRAL_CENTRAL_GENERATION_GUARD_HPP_INCLUDED

#include <cstdint>

namespace blecentral
{
namespace central
{

/// Monotonic counter which tells the active operation round apart from superseded ones.
///
/// Deferred work (f.e. a timeout) captures the generation it was scheduled for,
/// and does nothing if that generation is no longer the current one once it runs.
///
class GenerationGuard final
{
public:
    using Generation = std::uint64_t;

    /// Starts a new generation, which invalidates all previously issued ones.
    ///
    Generation advance() noexcept
    {
        return ++current_;
    }

    Generation current() const noexcept
    {
        return current_;
    }

    bool isCurrent(const Generation generation) const noexcept
    {
        return generation == current_;
    }

private:
    // Zero is never issued, so it is never current after the first `advance`.
    Generation current_{0};

};  // GenerationGuard

}  // namespace central
}  // namespace blecentral

#endif  // BLECENTRAL_CENTRAL_GENERATION_GUARD_HPP_INCLUDED
