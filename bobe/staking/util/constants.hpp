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
#include <bobe/staking/config.hpp>

#include <cstdint>

#include <intx/intx.hpp>

BOBE_STAKING_NAMESPACE_BEGIN

using namespace intx::literals;

// fixed point scale of the reward index and of reported rates
inline constexpr uint256_t SCALE{1000000000000000000_u256}; // 1e18

inline constexpr uint64_t SECONDS_PER_DAY{24 * 60 * 60};

inline constexpr uint64_t DEFAULT_CAMPAIGN_DURATION{86'280}; // 23h58m
inline constexpr uint64_t MAX_CAMPAIGN_DURATION{30 * SECONDS_PER_DAY};

inline constexpr uint64_t DEFAULT_UNSTAKE_PERIOD{365 * SECONDS_PER_DAY};
inline constexpr uint64_t MAX_UNSTAKE_PERIOD{365 * SECONDS_PER_DAY};

static_assert(DEFAULT_CAMPAIGN_DURATION <= MAX_CAMPAIGN_DURATION);
static_assert(DEFAULT_UNSTAKE_PERIOD <= MAX_UNSTAKE_PERIOD);

BOBE_STAKING_NAMESPACE_END
