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

BOBE_STAKING_NAMESPACE_BEGIN

// A time boxed reward emission over [start_time, finish_time). Campaigns
// never overlap: a new one is announced only once now >= finish_time.
struct Campaign
{
    uint64_t start_time{0};
    uint64_t finish_time{0};
    uint256_t reward_amount{0};

    uint64_t duration() const noexcept
    {
        return finish_time - start_time;
    }

    bool announced() const noexcept
    {
        return finish_time != 0;
    }

    bool active(uint64_t const now) const noexcept
    {
        return announced() && start_time <= now && now < finish_time;
    }

    bool finished(uint64_t const now) const noexcept
    {
        return now >= finish_time;
    }

    friend bool operator==(Campaign const &, Campaign const &) = default;
};

BOBE_STAKING_NAMESPACE_END
