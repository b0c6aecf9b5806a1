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

#include <bobe/core/assert.h>
#include <bobe/core/config.hpp>

#include <cstdint>

BOBE_NAMESPACE_BEGIN

// Source of block time in seconds. Contracts read it once at the start of
// every operation.
struct Clock
{
    virtual ~Clock() = default;

    virtual uint64_t now() const = 0;
};

// Externally driven clock, used by the replay tool and the tests
class ManualClock final : public Clock
{
    uint64_t now_;

public:
    explicit ManualClock(uint64_t const start = 0)
        : now_{start}
    {
    }

    uint64_t now() const override
    {
        return now_;
    }

    void set(uint64_t const t)
    {
        BOBE_ASSERT(t >= now_, "clock must not go backwards");
        now_ = t;
    }

    void advance(uint64_t const seconds)
    {
        now_ += seconds;
    }
};

BOBE_NAMESPACE_END
