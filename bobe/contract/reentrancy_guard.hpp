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

#include <bobe/core/config.hpp>

BOBE_NAMESPACE_BEGIN

// Holds a contract's busy flag for the lifetime of one entry point. A nested
// entry (e.g. from inside an asset transfer callback) sees the flag set and
// must be rejected by the caller.
class ReentrancyGuard
{
    bool &busy_;
    bool const entered_;

public:
    explicit ReentrancyGuard(bool &busy) noexcept
        : busy_{busy}
        , entered_{!busy}
    {
        busy_ = true;
    }

    ReentrancyGuard(ReentrancyGuard const &) = delete;
    ReentrancyGuard &operator=(ReentrancyGuard const &) = delete;

    ~ReentrancyGuard()
    {
        if (entered_) {
            busy_ = false;
        }
    }

    bool entered() const noexcept
    {
        return entered_;
    }
};

BOBE_NAMESPACE_END
