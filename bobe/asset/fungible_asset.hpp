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
#include <bobe/core/result.hpp>

#include <cstdint>

BOBE_NAMESPACE_BEGIN

// Transfer interface of an external token. Implementations are untrusted:
// a transfer may move less than requested (fee on transfer) or call back
// into the caller before returning.
class FungibleAsset
{
public:
    virtual ~FungibleAsset() = default;

    virtual Address const &address() const noexcept = 0;
    virtual uint8_t decimals() const noexcept = 0;

    virtual uint256_t balance_of(Address const &owner) const = 0;

    // move `amount` from `sender` to `to`
    virtual Result<void> transfer(
        Address const &sender, Address const &to, uint256_t const &amount) = 0;

    // move `amount` from `from` to `to` out of the allowance `from` granted
    // to `spender`
    virtual Result<void> transfer_from(
        Address const &spender, Address const &from, Address const &to,
        uint256_t const &amount) = 0;
};

BOBE_NAMESPACE_END
