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

#include <bobe/core/address.hpp>
#include <bobe/staking/config.hpp>

#include <ankerl/unordered_dense.h>

#include <cstddef>
#include <span>
#include <vector>

BOBE_STAKING_NAMESPACE_BEGIN

// Every address that ever staked, in first stake order. Entries are never
// removed, so offsets handed out by batch queries stay valid.
class StakerRegistry
{
    std::vector<Address> stakers_;
    ankerl::unordered_dense::set<Address> seen_;

public:
    // returns false if the address was already registered
    bool add(Address const &);

    bool contains(Address const &) const;

    size_t size() const noexcept
    {
        return stakers_.size();
    }

    bool empty() const noexcept
    {
        return stakers_.empty();
    }

    Address const &at(size_t) const;

    // up to count entries starting at offset, clamped to the end
    std::span<Address const> slice(size_t offset, size_t count) const;

    std::vector<Address> const &all() const noexcept
    {
        return stakers_;
    }
};

BOBE_STAKING_NAMESPACE_END
