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

#include <bobe/access/access_control.hpp>
#include <bobe/access/access_error.hpp>
#include <bobe/core/address.hpp>

#include <gtest/gtest.h>

using namespace bobe;

namespace
{
    constexpr Address ADMIN{0x100};
    constexpr Address ANNOUNCER{0x101};
    constexpr Address ALICE{0x200};
}

TEST(AccessControl, admin_satisfies_every_role)
{
    AccessControl access{ADMIN};
    EXPECT_TRUE(access.has_role(Role::Admin, ADMIN));
    EXPECT_TRUE(access.has_role(Role::Announcer, ADMIN));
    EXPECT_FALSE(access.has_role(Role::Announcer, ALICE));
    EXPECT_FALSE(access.check_role(Role::Admin, ADMIN).has_error());

    auto const res = access.check_role(Role::Admin, ALICE);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), AccessError::Unauthorized);
}

TEST(AccessControl, grant_and_revoke)
{
    AccessControl access{ADMIN};
    ASSERT_FALSE(
        access.grant_role(ADMIN, Role::Announcer, ANNOUNCER).has_error());
    EXPECT_TRUE(access.has_role(Role::Announcer, ANNOUNCER));
    EXPECT_FALSE(access.has_role(Role::Admin, ANNOUNCER));

    // announcers cannot manage roles
    auto res = access.grant_role(ANNOUNCER, Role::Announcer, ALICE);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), AccessError::Unauthorized);

    res = access.grant_role(ADMIN, Role::Announcer, Address{});
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), AccessError::InvalidAccount);

    ASSERT_FALSE(
        access.revoke_role(ADMIN, Role::Announcer, ANNOUNCER).has_error());
    EXPECT_FALSE(access.has_role(Role::Announcer, ANNOUNCER));
}

TEST(AccessControl, empty_until_bootstrapped)
{
    AccessControl access;
    EXPECT_TRUE(access.empty());
    access.bootstrap(Role::Admin, ADMIN);
    EXPECT_FALSE(access.empty());
    EXPECT_EQ(role_name(Role::Announcer), "announcer");
}
