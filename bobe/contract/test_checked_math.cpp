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

#include <bobe/contract/checked_math.hpp>
#include <bobe/core/int.hpp>

#include <gtest/gtest.h>

using namespace bobe;

TEST(CheckedMath, add_sub)
{
    EXPECT_EQ(checked_add(2, 3).value(), 5);
    EXPECT_EQ(checked_add(UINT256_MAX, 1).assume_error(), MathError::Overflow);
    EXPECT_EQ(checked_sub(3, 2).value(), 1);
    EXPECT_EQ(checked_sub(2, 3).assume_error(), MathError::Underflow);
}

TEST(CheckedMath, mul)
{
    EXPECT_EQ(checked_mul(6, 7).value(), 42);
    EXPECT_EQ(checked_mul(UINT256_MAX, 2).assume_error(), MathError::Overflow);
}

TEST(CheckedMath, mul_div_uses_wide_intermediate)
{
    // the product overflows 256 bits but the quotient fits
    EXPECT_EQ(checked_mul_div(UINT256_MAX, 3, 6).value(), UINT256_MAX / 2);
    EXPECT_EQ(
        checked_mul_div(UINT256_MAX, 6, 3).assume_error(), MathError::Overflow);
    EXPECT_EQ(
        checked_mul_div(1, 1, 0).assume_error(), MathError::DivisionByZero);
}

TEST(CheckedMath, saturating_sub)
{
    static_assert(saturating_sub(5, 3) == 2);
    EXPECT_EQ(saturating_sub(3, 5), 0);
}
