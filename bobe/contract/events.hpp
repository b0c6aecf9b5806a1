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
#include <bobe/core/int.hpp>

#include <string_view>
#include <utility>
#include <vector>

BOBE_NAMESPACE_BEGIN

// One entry of a contract's audit log
struct Log
{
    Address emitter{};
    std::string_view name{};
    std::vector<Address> topics{};
    std::vector<uint256_t> data{};

    friend bool operator==(Log const &, Log const &) = default;
};

class EventBuilder
{
    Log event_;

public:
    // name must have static storage duration
    explicit EventBuilder(Address const &emitter, std::string_view const name)
    {
        event_.emitter = emitter;
        event_.name = name;
    }

    // Add an indexed parameter
    EventBuilder &&add_topic(Address const &topic) &&
    {
        event_.topics.push_back(topic);
        return std::move(*this);
    }

    // Add a non-indexed parameter
    EventBuilder &&add_data(uint256_t const &data) &&
    {
        event_.data.push_back(data);
        return std::move(*this);
    }

    Log &&build() &&
    {
        return std::move(event_);
    }
};

BOBE_NAMESPACE_END
