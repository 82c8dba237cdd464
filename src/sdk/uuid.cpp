//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include <blecentral/sdk/uuid.hpp>

#include <cetl/pf17/cetlpf.hpp>

#include <cstddef>
#include <cstdint>
#include <string>

namespace blecentral
{
namespace sdk
{
namespace
{

// 0000xxxx-0000-1000-8000-00805F9B34FB
// NOLINTNEXTLINE(*-magic-numbers)
constexpr Uuid::Bytes BaseUuid{{0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x10, 0x00, 0x80, 0x00, 0x00, 0x80, 0x5F, 0x9B, 0x34, 0xFB}};

constexpr std::size_t ShortFormBytes = 4;

int hexDigitValue(const char ch)
{
    if ((ch >= '0') && (ch <= '9'))
    {
        return ch - '0';
    }
    if ((ch >= 'a') && (ch <= 'f'))
    {
        return ch - 'a' + 10;  // NOLINT(*-magic-numbers)
    }
    if ((ch >= 'A') && (ch <= 'F'))
    {
        return ch - 'A' + 10;  // NOLINT(*-magic-numbers)
    }
    return -1;
}

/// Parses a run of hex digits (without separators) into the given number of bytes.
///
bool parseHexBytes(const cetl::string_view hex, std::uint8_t* const out_bytes)
{
    for (std::size_t i = 0; i < hex.size(); i += 2)
    {
        const int high = hexDigitValue(hex[i]);
        const int low  = hexDigitValue(hex[i + 1]);
        if ((high < 0) || (low < 0))
        {
            return false;
        }
        out_bytes[i / 2] = static_cast<std::uint8_t>((high << 4) | low);  // NOLINT
    }
    return true;
}

}  // namespace

constexpr std::size_t Uuid::Size;

Uuid::Uuid(const std::uint32_t short_uuid) noexcept
    : bytes_{BaseUuid}
{
    // NOLINTBEGIN(*-magic-numbers)
    bytes_[0] = static_cast<std::uint8_t>(short_uuid >> 24U);
    bytes_[1] = static_cast<std::uint8_t>(short_uuid >> 16U);
    bytes_[2] = static_cast<std::uint8_t>(short_uuid >> 8U);
    bytes_[3] = static_cast<std::uint8_t>(short_uuid);
    // NOLINTEND(*-magic-numbers)
}

cetl::optional<Uuid> Uuid::parse(const cetl::string_view text)
{
    constexpr std::size_t Short16Len   = 4;
    constexpr std::size_t Short32Len   = 8;
    constexpr std::size_t CanonicalLen = 36;

    switch (text.size())
    {
    case Short16Len:
    case Short32Len: {
        std::uint8_t short_bytes[ShortFormBytes]{};
        // A 16-bit form occupies the lower two bytes of the 32-bit one.
        const std::size_t offset = ShortFormBytes - (text.size() / 2);
        if (!parseHexBytes(text, short_bytes + offset))  // NOLINT(*-pointer-arithmetic)
        {
            return cetl::nullopt;
        }
        Bytes bytes = BaseUuid;
        for (std::size_t i = 0; i < ShortFormBytes; ++i)
        {
            bytes[i] = short_bytes[i];  // NOLINT(*-constant-array-index)
        }
        return Uuid{bytes};
    }
    case CanonicalLen: {
        // 8-4-4-4-12 groups of hex digits.
        constexpr std::size_t dash_positions[] = {8, 13, 18, 23};  // NOLINT(*-magic-numbers)
        for (const auto pos : dash_positions)
        {
            if (text[pos] != '-')
            {
                return cetl::nullopt;
            }
        }
        std::string hex;
        hex.reserve(Size * 2);
        for (const char ch : text)
        {
            if (ch != '-')
            {
                hex.push_back(ch);
            }
        }
        if (hex.size() != (Size * 2))
        {
            return cetl::nullopt;
        }
        Bytes bytes{};
        if (!parseHexBytes(cetl::string_view{hex.data(), hex.size()}, bytes.data()))
        {
            return cetl::nullopt;
        }
        return Uuid{bytes};
    }
    default:
        return cetl::nullopt;
    }
}

cetl::optional<std::uint32_t> Uuid::shortForm() const noexcept
{
    for (std::size_t i = ShortFormBytes; i < Size; ++i)
    {
        if (bytes_[i] != BaseUuid[i])  // NOLINT(*-constant-array-index)
        {
            return cetl::nullopt;
        }
    }
    // NOLINTBEGIN(*-magic-numbers)
    return (static_cast<std::uint32_t>(bytes_[0]) << 24U) | (static_cast<std::uint32_t>(bytes_[1]) << 16U) |
           (static_cast<std::uint32_t>(bytes_[2]) << 8U) | static_cast<std::uint32_t>(bytes_[3]);
    // NOLINTEND(*-magic-numbers)
}

std::string Uuid::toString() const
{
    constexpr char digits[] = "0123456789ABCDEF";

    std::string result;
    result.reserve(36);  // NOLINT(*-magic-numbers)
    for (std::size_t i = 0; i < Size; ++i)
    {
        // NOLINTNEXTLINE(*-magic-numbers)
        if ((i == 4) || (i == 6) || (i == 8) || (i == 10))
        {
            result.push_back('-');
        }
        result.push_back(digits[bytes_[i] >> 4U]);    // NOLINT
        result.push_back(digits[bytes_[i] & 0x0FU]);  // NOLINT
    }
    return result;
}

}  // namespace sdk
}  // namespace blecentral
