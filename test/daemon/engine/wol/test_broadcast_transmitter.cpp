//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "wol/broadcast_transmitter.hpp"
#include "wol/hardware_address.hpp"
#include "wol/magic_packet.hpp"

#include <cetl/pf17/cetlpf.hpp>
#include <cetl/pf20/cetlpf.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cerrno>
#include <cstdint>
#include <string>

namespace
{

using namespace wolbot::daemon::engine::wol;  // NOLINT This our main concern here in the unit tests.

using testing::Ne;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestBroadcastTransmitter : public testing::Test
{
protected:
    // Real sockets are used here, so depending on the host network (or its absence) a send may either succeed
    // or fail with a routing error (f.e. `ENETUNREACH`). Only the outcomes of two sends are compared then.

    static const MagicPacket& packet()
    {
        static const MagicPacket magic_packet =
            encodeMagicPacket(HardwareAddress{HardwareAddress::Octets{0x02, 0x00, 0x5E, 0x10, 0x00, 0x01}});
        return magic_packet;
    }

    static cetl::span<const std::uint8_t> payload()
    {
        return {packet().data(), packet().size()};
    }

    // NOLINTBEGIN
    UdpBroadcastTransmitter transmitter_;
    // NOLINTEND
};

// MARK: - Tests:

TEST_F(TestBroadcastTransmitter, whole_magic_packet_goes_out_as_one_datagram)
{
    ASSERT_THAT(payload().size(), 102U);

    const int err = transmitter_.send(payload(), cetl::nullopt);
    EXPECT_THAT(err, Ne(EIO)) << "Datagram must never be truncated.";
}

TEST_F(TestBroadcastTransmitter, unknown_interface_falls_back_to_unbound_send)
{
    const int unbound_err = transmitter_.send(payload(), cetl::nullopt);
    const int hinted_err  = transmitter_.send(payload(), std::string{"wolbot-no-such-if0"});

    EXPECT_THAT(hinted_err, unbound_err);
    EXPECT_THAT(hinted_err, Ne(EIO));
    EXPECT_THAT(hinted_err, Ne(ENODEV));
}

TEST_F(TestBroadcastTransmitter, empty_interface_hint_is_no_hint)
{
    const int unbound_err = transmitter_.send(payload(), cetl::nullopt);
    const int hinted_err  = transmitter_.send(payload(), std::string{});

    EXPECT_THAT(hinted_err, unbound_err);
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
