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

#include <bobe/core/assert.h>
#include <bobe/staking/util/staker_registry.hpp>

#include <algorithm>

BOBE_STAKING_NAMESPACE_BEGIN

bool StakerRegistry::add(Address const &address)
{
    if (!seen_.insert(address).second) {
        return false;
    }
    stakers_.push_back(address);
    return true;
}

bool StakerRegistry::contains(Address const &address) const
{
    return seen_.contains(address);
}

Address const &StakerRegistry::at(size_t const i) const
{
    BOBE_ASSERT(i < stakers_.size());
    return stakers_[i];
}

std::span<Address const>
StakerRegistry::slice(size_t const offset, size_t const count) const
{
    if (offset >= stakers_.size()) {
        return {};
    }
    size_t const n = std::min(count, stakers_.size() - offset);
    return std::span<Address const>{stakers_}.subspan(offset, n);
}

BOBE_STAKING_NAMESPACE_END
