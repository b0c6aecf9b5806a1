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

#pragma once

#include <bobe/core/int.hpp>
#include <bobe/core/result.hpp>
#include <bobe/staking/config.hpp>
#include <bobe/staking/util/campaign.hpp>

#include <cstdint>

BOBE_STAKING_NAMESPACE_BEGIN

// Rewards per unit of stake accumulated since genesis, scaled by SCALE.
// The index is only ever advanced, lazily, by the next operation touching
// the contract.
struct AccrualIndex
{
    uint256_t index{0};
    uint64_t last_update_time{0};
    // sum over advances of (index delta * global stake); divided by SCALE
    // this is the reward released to stakers so far
    uint256_t distributed_scaled{0};

    uint256_t distributed() const;

    friend bool
    operator==(AccrualIndex const &, AccrualIndex const &) = default;
};

// Index increase for the part of [from, to) that overlaps the campaign:
// elapsed * reward * SCALE / (global_stake * duration). Zero when no stake
// is present or the window is empty.
Result<uint256_t> index_delta(
    Campaign const &, uint256_t const &global_stake, uint64_t from,
    uint64_t to);

// Seconds of the window [from, to) that fall inside the campaign
uint64_t overlap(Campaign const &, uint64_t from, uint64_t to) noexcept;

// Moves the index to now. last_update_time becomes now even when nothing
// accrues.
Result<void> advance(
    AccrualIndex &, Campaign const &, uint256_t const &global_stake,
    uint64_t now);

// Index value as if advanced to now, without mutating anything
Result<AccrualIndex> project(
    AccrualIndex const &, Campaign const &, uint256_t const &global_stake,
    uint64_t now);

// stake * (current - snapshot) / SCALE
Result<uint256_t> accrued_rewards(
    uint256_t const &stake, uint256_t const &current_index,
    uint256_t const &snapshot);

// reward * SCALE / global_stake / duration, the instantaneous per token
// emission. Zero without stake.
Result<uint256_t>
reward_rate_per_token(Campaign const &, uint256_t const &global_stake);

// share of the campaign emission per second going to stake
Result<uint256_t> rewards_per_second(
    Campaign const &, uint256_t const &stake, uint256_t const &global_stake);

BOBE_STAKING_NAMESPACE_END
