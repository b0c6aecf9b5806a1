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

#include <cstdint>
#include <vector>

BOBE_STAKING_NAMESPACE_BEGIN

struct PrincipalDeposit
{
    uint256_t amount;
    uint64_t timestamp;
};

// Append only history of one staker's deposits. A deposit unlocks once
// unstake_period seconds have passed since it was made; unstakes are
// charged against the oldest unlocked principal through total_unstaked.
class PrincipalTimelock
{
    std::vector<PrincipalDeposit> deposits_;
    // cumulative_[i] is the sum of deposits_[0..i]
    std::vector<uint256_t> cumulative_;

public:
    // timestamps must be non decreasing
    void append(uint256_t const &amount, uint64_t timestamp);

    std::vector<PrincipalDeposit> const &deposits() const noexcept
    {
        return deposits_;
    }

    uint256_t total_deposited() const;

    // sum of deposits made at or before now - unstake_period
    uint256_t matured(uint64_t now, uint64_t unstake_period) const;

    // matured principal not yet unstaked, saturating at zero
    uint256_t unlockable(
        uint64_t now, uint64_t unstake_period,
        uint256_t const &total_unstaked) const;
};

BOBE_STAKING_NAMESPACE_END
