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

#include <bobe/asset/token.hpp>
#include <bobe/contract/events.hpp>
#include <bobe/core/assert.h>
#include <bobe/core/fmt/address_fmt.hpp> // NOLINT
#include <bobe/core/fmt/int_fmt.hpp> // NOLINT
#include <bobe/core/likely.h>
#include <bobe/vesting/token_contract.hpp>
#include <bobe/vesting/vesting_error.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

#include <algorithm>

BOBE_NAMESPACE_BEGIN

uint64_t VestingBucket::available_portions(uint64_t const now) const noexcept
{
    if (now < start) {
        return 0;
    }
    return std::min(UNLOCK_PORTIONS, (now - start) / UNLOCK_PERIOD + 1);
}

TokenContract::TokenContract(
    Clock const &clock, Address const &self, Address const &owner)
    : Token{self, "Bobe.app", "BOBE"}
    , clock_{clock}
    , owner_{owner}
    , liquidity_supply_{BOBE_TOTAL_SUPPLY * LIQUIDITY_PERCENTAGE / 100}
    , liquidity_left_{liquidity_supply_}
{
    auto const marketing_supply =
        BOBE_TOTAL_SUPPLY * MARKETING_PERCENTAGE / 100;
    auto const team_supply =
        BOBE_TOTAL_SUPPLY - liquidity_supply_ - marketing_supply;
    uint64_t const now = clock_.now();

    marketing_ = VestingBucket{
        .supply = marketing_supply,
        .left = marketing_supply,
        .start = now,
        .unlocked_portions = 0};
    team_ = VestingBucket{
        .supply = team_supply,
        .left = team_supply,
        .start = now + TEAM_UNLOCK_DELAY,
        .unlocked_portions = 0};

    auto const minted = mint(self, BOBE_TOTAL_SUPPLY);
    BOBE_ASSERT(!minted.has_error());
}

Result<void> TokenContract::require_owner(Address const &sender) const
{
    if (BOBE_UNLIKELY(sender != owner_)) {
        return VestingError::Unauthorized;
    }
    return outcome::success();
}

Result<void> TokenContract::withdraw_liquidity(
    Address const &sender, Address const &to, uint256_t const &amount)
{
    BOOST_OUTCOME_TRY(require_owner(sender));
    if (BOBE_UNLIKELY(amount == 0)) {
        return VestingError::InvalidAmount;
    }
    if (BOBE_UNLIKELY(amount > liquidity_left_)) {
        return VestingError::InsufficientLiquidity;
    }
    if (BOBE_UNLIKELY(to == Address{})) {
        return VestingError::InvalidRecipient;
    }
    BOOST_OUTCOME_TRY(transfer(address(), to, amount));
    liquidity_left_ -= amount;
    emit_log(EventBuilder(address(), "LiquidityWithdrawn")
                 .add_topic(to)
                 .add_data(amount)
                 .build());
    return outcome::success();
}

Result<uint256_t> TokenContract::unlock(
    VestingBucket &bucket, Address const &to, std::string_view const event_name)
{
    if (BOBE_UNLIKELY(to == Address{})) {
        return VestingError::InvalidRecipient;
    }
    uint64_t const available = bucket.available_portions(clock_.now());
    if (BOBE_UNLIKELY(available <= bucket.unlocked_portions)) {
        return VestingError::NothingToUnlock;
    }

    // the final portion sweeps any rounding remainder
    uint256_t amount;
    if (available == UNLOCK_PORTIONS) {
        amount = bucket.left;
    }
    else {
        auto const portion = bucket.supply * UNLOCK_PERCENTAGE / 100;
        amount = portion * (available - bucket.unlocked_portions);
    }
    BOBE_ASSERT(amount <= bucket.left);

    BOOST_OUTCOME_TRY(transfer(address(), to, amount));
    bucket.left -= amount;
    bucket.unlocked_portions = available;
    emit_log(EventBuilder(address(), event_name)
                 .add_topic(to)
                 .add_data(amount)
                 .add_data(uint256_t{available})
                 .build());
    LOG_DEBUG(
        "TokenContract: {} released {} to {}, {} of {} portions",
        event_name,
        amount,
        to,
        available,
        UNLOCK_PORTIONS);
    return amount;
}

Result<uint256_t> TokenContract::unlock_marketing(
    Address const &sender, Address const &to)
{
    BOOST_OUTCOME_TRY(require_owner(sender));
    return unlock(marketing_, to, "MarketingUnlocked");
}

Result<uint256_t>
TokenContract::unlock_team(Address const &sender, Address const &to)
{
    BOOST_OUTCOME_TRY(require_owner(sender));
    return unlock(team_, to, "TeamUnlocked");
}

Result<void> TokenContract::transfer_ownership(
    Address const &sender, Address const &new_owner)
{
    BOOST_OUTCOME_TRY(require_owner(sender));
    if (BOBE_UNLIKELY(new_owner == Address{})) {
        return VestingError::InvalidRecipient;
    }
    emit_log(EventBuilder(address(), "OwnershipTransferred")
                 .add_topic(owner_)
                 .add_topic(new_owner)
                 .build());
    owner_ = new_owner;
    return outcome::success();
}

BOBE_NAMESPACE_END
