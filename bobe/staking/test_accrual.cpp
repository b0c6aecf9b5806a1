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

#include <bobe/contract/checked_math.hpp>
#include <bobe/core/int.hpp>
#include <bobe/staking/util/accrual.hpp>
#include <bobe/staking/util/campaign.hpp>
#include <bobe/staking/util/constants.hpp>

#include <gtest/gtest.h>
#include <intx/intx.hpp>

using namespace bobe;
using namespace bobe::staking;
using namespace intx::literals;

namespace
{
    constexpr uint64_t START{1'000};

    Campaign make_campaign(uint256_t const &reward, uint64_t const duration)
    {
        return Campaign{
            .start_time = START,
            .finish_time = START + duration,
            .reward_amount = reward};
    }
}

TEST(Accrual, overlap_clamps_to_campaign)
{
    auto const campaign = make_campaign(100, 50);
    EXPECT_EQ(overlap(campaign, 0, START), 0);
    EXPECT_EQ(overlap(campaign, 0, START + 10), 10);
    EXPECT_EQ(overlap(campaign, START + 10, START + 20), 10);
    EXPECT_EQ(overlap(campaign, START + 40, START + 500), 10);
    EXPECT_EQ(overlap(campaign, START + 50, START + 500), 0);
    EXPECT_EQ(overlap(Campaign{}, 0, START), 0);
}

TEST(Accrual, whole_campaign_is_exact)
{
    auto const campaign = make_campaign(5'000, DEFAULT_CAMPAIGN_DURATION);
    auto const delta =
        index_delta(campaign, 1'000, START, START + DEFAULT_CAMPAIGN_DURATION);
    ASSERT_FALSE(delta.has_error());
    EXPECT_EQ(delta.value(), 5 * SCALE);

    auto const rewards = accrued_rewards(1'000, delta.value(), 0);
    ASSERT_FALSE(rewards.has_error());
    EXPECT_EQ(rewards.value(), 5'000);
}

TEST(Accrual, no_stake_no_accrual)
{
    auto const campaign = make_campaign(5'000, 100);
    auto const delta = index_delta(campaign, 0, START, START + 100);
    ASSERT_FALSE(delta.has_error());
    EXPECT_EQ(delta.value(), 0);

    AccrualIndex acc{.index = 7, .last_update_time = START};
    ASSERT_FALSE(advance(acc, campaign, 0, START + 60).has_error());
    EXPECT_EQ(acc.index, 7);
    EXPECT_EQ(acc.last_update_time, START + 60);
    EXPECT_EQ(acc.distributed(), 0);
}

TEST(Accrual, split_advances_match_single_advance)
{
    auto const campaign = make_campaign(1'000'003, 86'280);

    AccrualIndex once{.last_update_time = START};
    ASSERT_FALSE(advance(once, campaign, 777, START + 86'280).has_error());

    AccrualIndex stepped{.last_update_time = START};
    for (uint64_t t = START + 1'000; t < START + 90'000; t += 1'000) {
        ASSERT_FALSE(advance(stepped, campaign, 777, t).has_error());
    }

    // flooring per step can only lose value
    EXPECT_LE(stepped.index, once.index);
    EXPECT_LE(stepped.distributed(), once.distributed());
    EXPECT_LE(once.distributed(), 1'000'003);
}

TEST(Accrual, distributed_never_exceeds_reward)
{
    auto const campaign = make_campaign(999, 7);
    AccrualIndex acc{.last_update_time = START};
    uint256_t stake{3};
    for (uint64_t t = START + 1; t <= START + 7; ++t) {
        ASSERT_FALSE(advance(acc, campaign, stake, t).has_error());
        stake += 5;
    }
    EXPECT_LE(acc.distributed(), 999);
}

TEST(Accrual, project_does_not_mutate)
{
    auto const campaign = make_campaign(5'000, 100);
    AccrualIndex const acc{.last_update_time = START};

    auto const projected = project(acc, campaign, 10, START + 50);
    ASSERT_FALSE(projected.has_error());
    EXPECT_EQ(projected.value().index, 250 * SCALE);
    EXPECT_EQ(projected.value().last_update_time, START + 50);
    EXPECT_EQ(acc.index, 0);

    // projecting into the past is a no op
    auto const stale = project(projected.value(), campaign, 10, START);
    ASSERT_FALSE(stale.has_error());
    EXPECT_TRUE(stale.value() == projected.value());
}

TEST(Accrual, rates)
{
    auto const campaign = make_campaign(345'120, 86'280);
    auto const per_token = reward_rate_per_token(campaign, 4'000);
    ASSERT_FALSE(per_token.has_error());
    EXPECT_EQ(per_token.value(), 1'000'000'000'000'000_u256);

    auto const share = rewards_per_second(campaign, 3'000, 4'000);
    ASSERT_FALSE(share.has_error());
    EXPECT_EQ(share.value(), 3);

    EXPECT_EQ(reward_rate_per_token(campaign, 0).value(), 0);
    EXPECT_EQ(rewards_per_second(campaign, 1, 0).value(), 0);
}

TEST(Accrual, snapshot_ahead_of_index_is_an_error)
{
    auto const res = accrued_rewards(1, 5, 6);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), MathError::Underflow);
}

TEST(Accrual, huge_rewards_overflow_cleanly)
{
    auto const campaign = make_campaign(UINT256_MAX, 1);
    auto const res = index_delta(campaign, 1, START, START + 1);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), MathError::Overflow);
}
