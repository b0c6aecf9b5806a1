// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#include <bobe/asset/asset_error.hpp>
#include <bobe/asset/test/test_tokens.hpp>
#include <bobe/asset/token.hpp>
#include <bobe/contract/checked_math.hpp>
#include <bobe/contract/events.hpp>
#include <bobe/core/address.hpp>
#include <bobe/core/int.hpp>

#include <gtest/gtest.h>

using namespace bobe;
using namespace bobe::test;

namespace
{
    constexpr Address TOKEN{0xa001};
    constexpr Address ALICE{0x200};
    constexpr Address BOB{0x201};
    constexpr Address SPENDER{0x300};
}

struct TokenTest : public ::testing::Test
{
    Token token{TOKEN, "Bobe.app", "BOBE"};

    void SetUp() override
    {
        ASSERT_FALSE(token.mint(ALICE, 1'000).has_error());
    }
};

TEST_F(TokenTest, metadata)
{
    EXPECT_EQ(token.name(), "Bobe.app");
    EXPECT_EQ(token.symbol(), "BOBE");
    EXPECT_EQ(token.decimals(), 18);
    EXPECT_EQ(token.address(), TOKEN);
    EXPECT_EQ(token.total_supply(), 1'000);
}

TEST_F(TokenTest, transfer_moves_balance)
{
    ASSERT_FALSE(token.transfer(ALICE, BOB, 400).has_error());
    EXPECT_EQ(token.balance_of(ALICE), 600);
    EXPECT_EQ(token.balance_of(BOB), 400);
    EXPECT_EQ(
        token.logs().back(),
        EventBuilder(TOKEN, "Transfer")
            .add_topic(ALICE)
            .add_topic(BOB)
            .add_data(400)
            .build());

    auto const res = token.transfer(ALICE, BOB, 601);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), AssetError::InsufficientBalance);
    EXPECT_EQ(token.balance_of(ALICE), 600);
}

TEST_F(TokenTest, transfer_to_zero_address_fails)
{
    auto const res = token.transfer(ALICE, Address{}, 1);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), AssetError::InvalidRecipient);

    auto const mint = token.mint(Address{}, 1);
    ASSERT_TRUE(mint.has_error());
    EXPECT_EQ(mint.assume_error(), AssetError::InvalidRecipient);
}

TEST_F(TokenTest, transfer_from_spends_allowance)
{
    auto res = token.transfer_from(SPENDER, ALICE, BOB, 1);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), AssetError::InsufficientAllowance);

    token.approve(ALICE, SPENDER, 300);
    EXPECT_EQ(token.allowance(ALICE, SPENDER), 300);
    ASSERT_FALSE(token.transfer_from(SPENDER, ALICE, BOB, 200).has_error());
    EXPECT_EQ(token.allowance(ALICE, SPENDER), 100);
    EXPECT_EQ(token.balance_of(BOB), 200);

    // a failed move leaves the allowance alone
    token.approve(ALICE, SPENDER, 5'000);
    res = token.transfer_from(SPENDER, ALICE, BOB, 2'000);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), AssetError::InsufficientBalance);
    EXPECT_EQ(token.allowance(ALICE, SPENDER), 5'000);
}

TEST_F(TokenTest, unlimited_allowance_is_not_decremented)
{
    token.approve(ALICE, SPENDER, UINT256_MAX);
    ASSERT_FALSE(token.transfer_from(SPENDER, ALICE, BOB, 10).has_error());
    EXPECT_EQ(token.allowance(ALICE, SPENDER), UINT256_MAX);
}

TEST_F(TokenTest, burn_reduces_supply)
{
    ASSERT_FALSE(token.burn(ALICE, 250).has_error());
    EXPECT_EQ(token.total_supply(), 750);
    EXPECT_EQ(token.balance_of(ALICE), 750);

    auto const res = token.burn(BOB, 1);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), AssetError::InsufficientBalance);
}

TEST_F(TokenTest, mint_overflow_is_rejected)
{
    auto const res = token.mint(BOB, UINT256_MAX);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), MathError::Overflow);
    EXPECT_EQ(token.total_supply(), 1'000);
}

TEST(FeeOnTransferToken, recipient_receives_less)
{
    FeeOnTransferToken token{TOKEN, "Fee", "FEE", 250};
    ASSERT_FALSE(token.mint(ALICE, 1'000).has_error());
    ASSERT_FALSE(token.transfer(ALICE, BOB, 1'000).has_error());
    EXPECT_EQ(token.balance_of(ALICE), 0);
    EXPECT_EQ(token.balance_of(BOB), 975);
}
