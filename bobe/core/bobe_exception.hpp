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
#include <bobe/core/likely.h>

#include <cstddef>

#include <unistd.h>

BOBE_NAMESPACE_BEGIN

class BobeException
{
public:
    BobeException(
        char const *message, char const *expr, char const *function,
        char const *file, long line);

    char const *message() const noexcept;
    void print(int fd = STDERR_FILENO) const noexcept;

    static constexpr size_t message_buffer_size = 256;

private:
    char const *expr_;
    char const *function_;
    char const *file_;
    long line_;
    char message_[message_buffer_size];
};

static_assert(sizeof(BobeException) < 512);

BOBE_NAMESPACE_END

#define BOBE_THROW(expr, message)                                              \
    if (BOBE_LIKELY(expr)) { /* likeliest */                                   \
    }                                                                          \
    else {                                                                     \
        throw bobe::BobeException{                                             \
            (message),                                                         \
            #expr,                                                             \
            __extension__ __PRETTY_FUNCTION__,                                 \
            __FILE__,                                                          \
            __LINE__};                                                         \
    }
