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
#include <bobe/core/result.hpp>

#include <ankerl/unordered_dense.h>

#include <cstdint>
#include <string_view>

BOBE_NAMESPACE_BEGIN

enum class Role : uint8_t
{
    Admin = 0,
    Announcer,
};

std::string_view role_name(Role);

// Role membership of one contract. Admins satisfy every role check.
class AccessControl
{
    ankerl::unordered_dense::set<Address> admins_;
    ankerl::unordered_dense::set<Address> announcers_;

    ankerl::unordered_dense::set<Address> &members(Role);
    ankerl::unordered_dense::set<Address> const &members(Role) const;

public:
    AccessControl() = default;
    explicit AccessControl(Address const &admin);

    bool has_role(Role, Address const &) const;
    Result<void> check_role(Role, Address const &) const;

    // sender must be an admin
    Result<void>
    grant_role(Address const &sender, Role, Address const &account);
    Result<void>
    revoke_role(Address const &sender, Role, Address const &account);

    // unchecked; used once when the owning contract is initialized
    void bootstrap(Role, Address const &account);

    bool empty() const noexcept
    {
        return admins_.empty();
    }
};

BOBE_NAMESPACE_END
