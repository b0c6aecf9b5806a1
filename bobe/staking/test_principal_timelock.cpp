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

#include <bobe/core/int.hpp>
#include <bobe/staking/util/principal_timelock.hpp>
#include <bobe/staking/util/staker_registry.hpp>

#include <cstdint>
#include <vector>

#include <gtest/gtest.h>

using namespace bobe;
using namespace bobe::staking;

TEST(PrincipalTimelock, deposits_mature_independently)
{
    PrincipalTimelock lock;
    lock.append(100, 10);
    lock.append(200, 20);
    lock.append(300, 20);
    lock.append(400, 35);

    EXPECT_EQ(lock.total_deposited(), 1'000);
    EXPECT_EQ(lock.matured(9, 0), 0);
    EXPECT_EQ(lock.matured(14, 5), 0);
    EXPECT_EQ(lock.matured(15, 5), 100);
    EXPECT_EQ(lock.matured(25, 5), 600);
    EXPECT_EQ(lock.matured(39, 5), 600);
    EXPECT_EQ(lock.matured(40, 5), 1'000);
    // period longer than the elapsed time since genesis
    EXPECT_EQ(lock.matured(3, 5), 0);
}

TEST(PrincipalTimelock, unstaked_principal_is_subtracted)
{
    PrincipalTimelock lock;
    lock.append(100, 10);
    lock.append(200, 20);

    EXPECT_EQ(lock.unlockable(30, 10, 0), 300);
    EXPECT_EQ(lock.unlockable(30, 10, 120), 180);
    // unstaked under a shorter period than the current one
    EXPECT_EQ(lock.unlockable(30, 15, 250), 0);
}

TEST(PrincipalTimelock, unlocking_is_monotonic_in_time)
{
    PrincipalTimelock lock;
    for (uint64_t t = 0; t < 50; t += 7) {
        lock.append(t + 1, t);
    }
    uint256_t previous{0};
    for (uint64_t now = 0; now < 100; ++now) {
        auto const unlocked = lock.unlockable(now, 13, 0);
        EXPECT_GE(unlocked, previous);
        previous = unlocked;
    }
    EXPECT_EQ(previous, lock.total_deposited());
}

TEST(StakerRegistry, append_only_and_unique)
{
    StakerRegistry registry;
    EXPECT_TRUE(registry.empty());
    EXPECT_TRUE(registry.add(Address{1}));
    EXPECT_TRUE(registry.add(Address{2}));
    EXPECT_FALSE(registry.add(Address{1}));
    EXPECT_TRUE(registry.add(Address{3}));

    EXPECT_EQ(registry.size(), 3);
    EXPECT_TRUE(registry.contains(Address{2}));
    EXPECT_FALSE(registry.contains(Address{4}));
    EXPECT_EQ(registry.at(2), Address{3});
}

TEST(StakerRegistry, slices_are_clamped)
{
    StakerRegistry registry;
    for (uint64_t i = 1; i <= 5; ++i) {
        registry.add(Address{i});
    }

    auto const middle = registry.slice(1, 2);
    EXPECT_EQ(
        std::vector<Address>(middle.begin(), middle.end()),
        (std::vector<Address>{Address{2}, Address{3}}));

    EXPECT_EQ(registry.slice(3, 100).size(), 2);
    EXPECT_TRUE(registry.slice(5, 1).empty());
}
