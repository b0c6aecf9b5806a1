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
#include <bobe/staking/util/principal_timelock.hpp>

#include <algorithm>
#include <iterator>

BOBE_STAKING_NAMESPACE_BEGIN

void PrincipalTimelock::append(
    uint256_t const &amount, uint64_t const timestamp)
{
    BOBE_ASSERT(deposits_.empty() || deposits_.back().timestamp <= timestamp);
    deposits_.push_back({.amount = amount, .timestamp = timestamp});
    // bounded by the asset supply
    cumulative_.push_back(total_deposited() + amount);
}

uint256_t PrincipalTimelock::total_deposited() const
{
    return cumulative_.empty() ? uint256_t{0} : cumulative_.back();
}

uint256_t PrincipalTimelock::matured(
    uint64_t const now, uint64_t const unstake_period) const
{
    if (now < unstake_period) {
        return 0;
    }
    uint64_t const cutoff = now - unstake_period;
    auto const it = std::upper_bound(
        deposits_.begin(),
        deposits_.end(),
        cutoff,
        [](uint64_t const t, PrincipalDeposit const &d) {
            return t < d.timestamp;
        });
    auto const n = std::distance(deposits_.begin(), it);
    return n == 0 ? uint256_t{0} : cumulative_[static_cast<size_t>(n - 1)];
}

uint256_t PrincipalTimelock::unlockable(
    uint64_t const now, uint64_t const unstake_period,
    uint256_t const &total_unstaked) const
{
    return saturating_sub(matured(now, unstake_period), total_unstaked);
}

BOBE_STAKING_NAMESPACE_END
