//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef WOLBOT_DAEMON_ENGINE_WOL_HARDWARE_ADDRESS_HPP_INCLUDED
#define WOLBOT_DAEMON_ENGINE_WOL_HARDWARE_ADDRESS_HPP_INCLUDED

#include <cetl/pf17/cetlpf.hpp>

#include <array>
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

/// Link-layer (MAC) address of a network interface - always exactly 6 octets.
///
class HardwareAddress final
{
public:
    static constexpr std::size_t Size = 6;

    using Octets = std::array<std::uint8_t, Size>;

    struct InvalidAddressFormat final
    {
        std::string reason;
    };

    struct ParseResult
    {
        using Success = HardwareAddress;
        using Failure = InvalidAddressFormat;
        using Var     = cetl::variant<Success, Failure>;
    };

    /// Parses textual address, like "AA:BB:CC:DD:EE:FF" or "aa-bb-cc-dd-ee-ff".
    ///
    /// Octets are hexadecimal tokens separated by `:` or `-` (both may be mixed; empty tokens are ignored).
    /// Fails if any token is not a hex octet, or if the number of octets is not exactly 6.
    ///
    static ParseResult::Var parse(const std::string& str);

    explicit HardwareAddress(const Octets& octets) noexcept
        : octets_{octets}
    {
    }

    const Octets& octets() const noexcept
    {
        return octets_;
    }

    /// Canonical upper-case colon-separated form.
    std::string toString() const;

    bool operator==(const HardwareAddress& other) const noexcept
    {
        return octets_ == other.octets_;
    }

    bool operator!=(const HardwareAddress& other) const noexcept
    {
        return !(*this == other);
    }

private:
    static cetl::optional<std::uint8_t> tryParseOctet(const std::string& token);

    Octets octets_;

};  // HardwareAddress

}  // namespace wol
}  // namespace engine
}  // namespace daemon
}  // namespace wolbot

#endif  // WOLBOT_DAEMON_ENGINE_WOL_HARDWARE_ADDRESS_HPP_INCLUDED
