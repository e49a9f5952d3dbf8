//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "wol/hardware_address.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>

namespace
{

using namespace wolbot::daemon::engine::wol;  // NOLINT This our main concern here in the unit tests.

using testing::_;
using testing::ElementsAre;
using testing::VariantWith;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestHardwareAddress : public testing::Test
{
protected:
    using Result = HardwareAddress::ParseResult;

    static HardwareAddress parseValid(const std::string& str)
    {
        auto result = HardwareAddress::parse(str);
        EXPECT_THAT(result, VariantWith<Result::Success>(_)) << "str='" << str << "'";
        if (const auto* const success = cetl::get_if<Result::Success>(&result))
        {
            return *success;
        }
        return HardwareAddress{HardwareAddress::Octets{}};
    }
};

// MARK: - Tests:

TEST_F(TestHardwareAddress, parse_colon_separated)
{
    const auto hw_address = parseValid("AA:BB:CC:DD:EE:FF");
    EXPECT_THAT(hw_address.octets(), ElementsAre(0xAA, 0xBB, 0xCC, 0xDD, 0xEE, 0xFF));
    EXPECT_THAT(hw_address.toString(), "AA:BB:CC:DD:EE:FF");
}

TEST_F(TestHardwareAddress, parse_dash_separated_lower_case)
{
    const auto hw_address = parseValid("00-1a-2b-3c-4d-5e");
    EXPECT_THAT(hw_address.octets(), ElementsAre(0x00, 0x1A, 0x2B, 0x3C, 0x4D, 0x5E));
    EXPECT_THAT(hw_address.toString(), "00:1A:2B:3C:4D:5E");
}

TEST_F(TestHardwareAddress, parse_lenient_forms)
{
    // Mixed separators.
    EXPECT_THAT(parseValid("00:11-22:33-44:55"), parseValid("00:11:22:33:44:55"));

    // Empty tokens are ignored.
    EXPECT_THAT(parseValid("00::11:22:33:44:55:"), parseValid("00:11:22:33:44:55"));

    // Single digit octets.
    EXPECT_THAT(parseValid("0:1:2:a:b:c").octets(), ElementsAre(0, 1, 2, 0x0A, 0x0B, 0x0C));
}

TEST_F(TestHardwareAddress, parse_invalid)
{
    // Wrong octets count.
    EXPECT_THAT(HardwareAddress::parse("AA:BB:CC:DD:EE"), VariantWith<Result::Failure>(_));
    EXPECT_THAT(HardwareAddress::parse("AA:BB:CC:DD:EE:FF:00"), VariantWith<Result::Failure>(_));
    EXPECT_THAT(HardwareAddress::parse(""), VariantWith<Result::Failure>(_));
    EXPECT_THAT(HardwareAddress::parse(":-:"), VariantWith<Result::Failure>(_));

    // Not a hex octet.
    EXPECT_THAT(HardwareAddress::parse("GG:BB:CC:DD:EE:FF"), VariantWith<Result::Failure>(_));
    EXPECT_THAT(HardwareAddress::parse("AAA:BB:CC:DD:EE:FF"), VariantWith<Result::Failure>(_));
    EXPECT_THAT(HardwareAddress::parse("AA BB CC DD EE FF"), VariantWith<Result::Failure>(_));
    EXPECT_THAT(HardwareAddress::parse("+A:BB:CC:DD:EE:FF"), VariantWith<Result::Failure>(_));
}

TEST_F(TestHardwareAddress, failure_has_reason)
{
    auto result = HardwareAddress::parse("AA:BB");
    ASSERT_THAT(result, VariantWith<Result::Failure>(_));
    EXPECT_FALSE(cetl::get<Result::Failure>(result).reason.empty());
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
