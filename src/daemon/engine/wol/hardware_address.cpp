//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "hardware_address.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <cctype>
#include <cstddef>
#include <cstdint>
#include <string>

namespace wolbot
{
namespace daemon
{
namespace engine
{
namespace wol
{

constexpr std::size_t HardwareAddress::Size;

HardwareAddress::ParseResult::Var HardwareAddress::parse(const std::string& str)
{
    Octets      octets{};
    std::size_t octets_count = 0;

    std::size_t token_begin = 0;
    while (token_begin <= str.size())
    {
        const auto sep_pos   = str.find_first_of(":-", token_begin);
        const auto token_end = (sep_pos == std::string::npos) ? str.size() : sep_pos;
        const auto token     = str.substr(token_begin, token_end - token_begin);
        token_begin          = token_end + 1;

        if (token.empty())
        {
            continue;
        }

        const auto octet = tryParseOctet(token);
        if (!octet)
        {
            return InvalidAddressFormat{"invalid hex octet '" + token + "'"};
        }
        if (octets_count == Size)
        {
            return InvalidAddressFormat{"more than 6 octets"};
        }
        octets[octets_count++] = *octet;  // NOLINT(*-pro-bounds-constant-array-index)
    }

    if (octets_count != Size)
    {
        return InvalidAddressFormat{"expected 6 octets, got " + std::to_string(octets_count)};
    }
    return HardwareAddress{octets};
}

cetl::optional<std::uint8_t> HardwareAddress::tryParseOctet(const std::string& token)
{
    if (token.size() > 2)
    {
        return cetl::nullopt;
    }

    std::uint8_t value = 0;
    for (const char ch : token)
    {
        const auto uch = static_cast<unsigned char>(ch);
        if (std::isxdigit(uch) == 0)
        {
            return cetl::nullopt;
        }
        const auto nibble = std::isdigit(uch) != 0 ? (uch - '0') : (std::toupper(uch) - 'A' + 10);
        value             = static_cast<std::uint8_t>((value << 4U) | static_cast<unsigned>(nibble));
    }
    return value;
}

std::string HardwareAddress::toString() const
{
    constexpr const char* HexDigits = "0123456789ABCDEF";

    std::string result;
    result.reserve(Size * 3);
    for (const auto octet : octets_)
    {
        if (!result.empty())
        {
            result += ':';
        }
        result += HexDigits[octet >> 4U];   // NOLINT(*-pro-bounds-pointer-arithmetic)
        result += HexDigits[octet & 0xFU];  // NOLINT(*-pro-bounds-pointer-arithmetic)
    }
    return result;
}

}  // namespace wol
}  // namespace engine
}  // namespace daemon
}  // namespace wolbot
