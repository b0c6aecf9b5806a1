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
#include <bobe/core/assert.h>
#include <bobe/core/likely.h>
#include <bobe/staking/util/accrual.hpp>
#include <bobe/staking/util/constants.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <algorithm>

BOBE_STAKING_NAMESPACE_BEGIN

uint256_t AccrualIndex::distributed() const
{
    return distributed_scaled / SCALE;
}

uint64_t overlap(
    Campaign const &campaign, uint64_t const from, uint64_t const to) noexcept
{
    uint64_t const start = std::max(campaign.start_time, from);
    uint64_t const end = std::min(campaign.finish_time, to);
    return start < end ? end - start : 0;
}

Result<uint256_t> index_delta(
    Campaign const &campaign, uint256_t const &global_stake,
    uint64_t const from, uint64_t const to)
{
    uint64_t const elapsed = overlap(campaign, from, to);
    if (elapsed == 0 || global_stake == 0) {
        return uint256_t{0};
    }
    BOBE_ASSERT(campaign.duration() > 0);

    // multiply before dividing so that a lone staker over the whole
    // campaign receives exactly reward_amount
    uint512_t const numerator =
        intx::umul(campaign.reward_amount, SCALE) * uint512_t{elapsed};
    uint512_t const denominator =
        intx::umul(global_stake, uint256_t{campaign.duration()});
    uint512_t const delta = numerator / denominator;
    if (BOBE_UNLIKELY(delta > UINT256_MAX)) {
        return MathError::Overflow;
    }
    return static_cast<uint256_t>(delta);
}

Result<void> advance(
    AccrualIndex &acc, Campaign const &campaign, uint256_t const &global_stake,
    uint64_t const now)
{
    BOBE_ASSERT(now >= acc.last_update_time);
    BOOST_OUTCOME_TRY(
        auto const delta,
        index_delta(campaign, global_stake, acc.last_update_time, now));
    if (delta != 0) {
        BOOST_OUTCOME_TRY(auto const index, checked_add(acc.index, delta));
        BOOST_OUTCOME_TRY(
            auto const released, checked_mul(delta, global_stake));
        BOOST_OUTCOME_TRY(
            auto const distributed_scaled,
            checked_add(acc.distributed_scaled, released));
        acc.index = index;
        acc.distributed_scaled = distributed_scaled;
    }
    acc.last_update_time = now;
    return outcome::success();
}

Result<AccrualIndex> project(
    AccrualIndex const &acc, Campaign const &campaign,
    uint256_t const &global_stake, uint64_t const now)
{
    AccrualIndex projected = acc;
    if (now > acc.last_update_time) {
        BOOST_OUTCOME_TRY(advance(projected, campaign, global_stake, now));
    }
    return projected;
}

Result<uint256_t> accrued_rewards(
    uint256_t const &stake, uint256_t const &current_index,
    uint256_t const &snapshot)
{
    BOOST_OUTCOME_TRY(auto const delta, checked_sub(current_index, snapshot));
    return checked_mul_div(stake, delta, SCALE);
}

Result<uint256_t> reward_rate_per_token(
    Campaign const &campaign, uint256_t const &global_stake)
{
    if (global_stake == 0 || campaign.duration() == 0) {
        return uint256_t{0};
    }
    BOOST_OUTCOME_TRY(
        auto const per_token,
        checked_mul_div(campaign.reward_amount, SCALE, global_stake));
    return per_token / campaign.duration();
}

Result<uint256_t> rewards_per_second(
    Campaign const &campaign, uint256_t const &stake,
    uint256_t const &global_stake)
{
    if (global_stake == 0 || campaign.duration() == 0) {
        return uint256_t{0};
    }
    BOOST_OUTCOME_TRY(
        auto const share,
        checked_mul_div(campaign.reward_amount, stake, global_stake));
    return share / campaign.duration();
}

BOBE_STAKING_NAMESPACE_END
