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

#include <bobe/asset/token.hpp>
#include <bobe/core/address.hpp>
#include <bobe/core/clock.hpp>
#include <bobe/core/config.hpp>
#include <bobe/core/int.hpp>
#include <bobe/core/result.hpp>

#include <cstdint>
#include <string_view>

#include <intx/intx.hpp>

BOBE_NAMESPACE_BEGIN

using namespace intx::literals;

inline constexpr uint256_t BOBE_TOTAL_SUPPLY{
    1000000000000000000000000000_u256}; // 1e9 tokens, 18 decimals

inline constexpr uint256_t LIQUIDITY_PERCENTAGE{80};
inline constexpr uint256_t MARKETING_PERCENTAGE{12};

inline constexpr uint64_t UNLOCK_PERIOD{30 * 24 * 60 * 60};
inline constexpr uint64_t UNLOCK_PERCENTAGE{10};
inline constexpr uint64_t UNLOCK_PORTIONS{10};
inline constexpr uint64_t TEAM_UNLOCK_DELAY{548 * 24 * 60 * 60};

static_assert(UNLOCK_PERCENTAGE * UNLOCK_PORTIONS == 100);

// One time vested allocation, released in UNLOCK_PORTIONS equal portions,
// one every UNLOCK_PERIOD from start
struct VestingBucket
{
    uint256_t supply{0};
    uint256_t left{0};
    uint64_t start{0};
    uint64_t unlocked_portions{0};

    // portions released or releasable at now
    uint64_t available_portions(uint64_t now) const noexcept;
};

// The fixed supply BOBE token. The whole supply is minted to the contract
// itself and handed out from three buckets: liquidity at the owner's
// discretion, marketing and team on a monthly schedule.
class TokenContract final : public Token
{
    Clock const &clock_;
    Address owner_;

    uint256_t liquidity_supply_;
    uint256_t liquidity_left_;
    VestingBucket marketing_;
    VestingBucket team_;

    // the supply is fixed at construction
    using Token::burn;
    using Token::mint;

    Result<void> require_owner(Address const &) const;
    Result<uint256_t> unlock(
        VestingBucket &, Address const &to, std::string_view event_name);

public:
    TokenContract(Clock const &, Address const &self, Address const &owner);

    Result<void> withdraw_liquidity(
        Address const &sender, Address const &to, uint256_t const &amount);
    // both return the amount released
    Result<uint256_t>
    unlock_marketing(Address const &sender, Address const &to);
    Result<uint256_t> unlock_team(Address const &sender, Address const &to);
    Result<void>
    transfer_ownership(Address const &sender, Address const &new_owner);

    Address const &owner() const noexcept
    {
        return owner_;
    }

    uint256_t const &liquidity_supply() const noexcept
    {
        return liquidity_supply_;
    }

    uint256_t const &liquidity_left() const noexcept
    {
        return liquidity_left_;
    }

    uint256_t const &marketing_supply() const noexcept
    {
        return marketing_.supply;
    }

    uint256_t const &marketing_left() const noexcept
    {
        return marketing_.left;
    }

    uint256_t const &team_supply() const noexcept
    {
        return team_.supply;
    }

    uint256_t const &team_left() const noexcept
    {
        return team_.left;
    }

    uint64_t marketing_unlocked_portions() const noexcept
    {
        return marketing_.unlocked_portions;
    }

    uint64_t team_unlocked_portions() const noexcept
    {
        return team_.unlocked_portions;
    }

    uint64_t marketing_unlock_start() const noexcept
    {
        return marketing_.start;
    }

    uint64_t team_unlock_start() const noexcept
    {
        return team_.start;
    }
};

BOBE_NAMESPACE_END
