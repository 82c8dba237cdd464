//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef BLECENTRAL_SDK_UUID_HPP_INCLUDED
#define BLECENTRAL_SDK_UUID_HPP_INCLUDED

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <spdlog/fmt/fmt.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <unordered_set>

namespace blecentral
{
namespace sdk
{

/// 128-bit Bluetooth UUID of a GATT attribute (service, characteristic, etc.).
///
/// Short 16-bit and 32-bit forms are expanded over the Bluetooth Base UUID
/// (`0000xxxx-0000-1000-8000-00805F9B34FB`), so that `Uuid{0x180D}` equals
/// the full 128-bit form of the Heart Rate service.
///
class Uuid final
{
public:
    static constexpr std::size_t Size = 16;
    using Bytes                       = std::array<std::uint8_t, Size>;

    /// Parses 4, 8 or 36 (canonical, with dashes) hex characters. Case-insensitive.
    ///
    /// @return `nullopt` if the text is not a valid UUID.
    ///
    CETL_NODISCARD static cetl::optional<Uuid> parse(const cetl::string_view text);

    Uuid() noexcept
        : bytes_{}
    {
    }

    explicit Uuid(const std::uint32_t short_uuid) noexcept;

    explicit Uuid(const Bytes& bytes) noexcept
        : bytes_{bytes}
    {
    }

    const Bytes& bytes() const noexcept
    {
        return bytes_;
    }

    /// Gets the 16/32-bit short form, if the UUID is based on the Bluetooth Base UUID.
    ///
    cetl::optional<std::uint32_t> shortForm() const noexcept;

    /// Canonical upper-case form, e.g. "0000180D-0000-1000-8000-00805F9B34FB".
    ///
    std::string toString() const;

    friend bool operator==(const Uuid& lhs, const Uuid& rhs) noexcept
    {
        return lhs.bytes_ == rhs.bytes_;
    }

    friend bool operator!=(const Uuid& lhs, const Uuid& rhs) noexcept
    {
        return !(lhs == rhs);
    }

    friend bool operator<(const Uuid& lhs, const Uuid& rhs) noexcept
    {
        return lhs.bytes_ < rhs.bytes_;
    }

private:
    Bytes bytes_;

};  // Uuid

}  // namespace sdk
}  // namespace blecentral

namespace std
{
template <>
struct hash<blecentral::sdk::Uuid>
{
    std::size_t operator()(const blecentral::sdk::Uuid& uuid) const noexcept
    {
        // FNV-1a over the raw bytes.
        std::uint64_t result = 14695981039346656037ULL;  // NOLINT(*-magic-numbers)
        for (const auto byte : uuid.bytes())
        {
            result ^= byte;
            result *= 1099511628211ULL;  // NOLINT(*-magic-numbers)
        }
        return static_cast<std::size_t>(result);
    }
};
}  // namespace std

namespace blecentral
{
namespace sdk
{

using UuidSet = std::unordered_set<Uuid>;

}  // namespace sdk
}  // namespace blecentral

// MARK: - Formatting

// NOLINTBEGIN
template <>
struct fmt::formatter<blecentral::sdk::Uuid> : formatter<string_view>
{
    auto format(const blecentral::sdk::Uuid& uuid, format_context& ctx) const
    {
        if (const auto short_form = uuid.shortForm())
        {
            return format_to(ctx.out(), "{:04X}", *short_form);
        }
        return formatter<string_view>::format(uuid.toString(), ctx);
    }
};
// NOLINTEND

#endif  // BLECENTRAL_SDK_UUID_HPP_INCLUDED
