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
#include <bobe/core/config.hpp>

#include <cstdint>

BOBE_NAMESPACE_BEGIN

struct RoundData
{
    int64_t answer;
    uint64_t updated_at;
};

// USD price oracle for one asset, in the shape of a Chainlink aggregator.
// The answer carries decimals() fractional digits.
class PriceFeed
{
public:
    virtual ~PriceFeed() = default;

    virtual Address const &address() const noexcept = 0;
    virtual uint8_t decimals() const noexcept = 0;
    virtual RoundData latest_round() const = 0;
};

BOBE_NAMESPACE_END
