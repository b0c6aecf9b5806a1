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
#include <bobe/staking/util/principal_timelock.hpp>

BOBE_STAKING_NAMESPACE_BEGIN

// Accrual state of one staker. Kept trivially copyable so that an entry
// point can snapshot it and restore it if a payout fails.
struct StakerLedger
{
    uint256_t stake{0};
    uint256_t index_snapshot{0};
    uint256_t unclaimed_rewards{0};
    uint256_t total_claimed{0};
    uint256_t total_unstaked{0};

    friend bool
    operator==(StakerLedger const &, StakerLedger const &) = default;
};

struct Staker
{
    StakerLedger ledger;
    PrincipalTimelock timelock;
};

BOBE_STAKING_NAMESPACE_END
