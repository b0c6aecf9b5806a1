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
#include <bobe/core/assert.h>
#include <bobe/core/fmt/address_fmt.hpp> // NOLINT
#include <bobe/core/likely.h>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

BOBE_NAMESPACE_BEGIN

std::string_view role_name(Role const role)
{
    switch (role) {
    case Role::Admin:
        return "admin";
    case Role::Announcer:
        return "announcer";
    }
    BOBE_ABORT("unknown role");
}

AccessControl::AccessControl(Address const &admin)
{
    admins_.insert(admin);
}

ankerl::unordered_dense::set<Address> &AccessControl::members(Role const role)
{
    return role == Role::Admin ? admins_ : announcers_;
}

ankerl::unordered_dense::set<Address> const &
AccessControl::members(Role const role) const
{
    return role == Role::Admin ? admins_ : announcers_;
}

bool AccessControl::has_role(Role const role, Address const &account) const
{
    if (admins_.contains(account)) {
        return true;
    }
    return members(role).contains(account);
}

Result<void>
AccessControl::check_role(Role const role, Address const &account) const
{
    if (BOBE_UNLIKELY(!has_role(role, account))) {
        return AccessError::Unauthorized;
    }
    return outcome::success();
}

Result<void> AccessControl::grant_role(
    Address const &sender, Role const role, Address const &account)
{
    BOOST_OUTCOME_TRY(check_role(Role::Admin, sender));
    if (BOBE_UNLIKELY(account == Address{})) {
        return AccessError::InvalidAccount;
    }
    members(role).insert(account);
    LOG_DEBUG(
        "AccessControl: {} granted {} to {}", sender, role_name(role), account);
    return outcome::success();
}

Result<void> AccessControl::revoke_role(
    Address const &sender, Role const role, Address const &account)
{
    BOOST_OUTCOME_TRY(check_role(Role::Admin, sender));
    members(role).erase(account);
    LOG_DEBUG(
        "AccessControl: {} revoked {} from {}",
        sender,
        role_name(role),
        account);
    return outcome::success();
}

void AccessControl::bootstrap(Role const role, Address const &account)
{
    members(role).insert(account);
}

BOBE_NAMESPACE_END
