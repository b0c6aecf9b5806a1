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
#include <bobe/contract/checked_math.hpp>
#include <bobe/contract/events.hpp>
#include <bobe/contract/reentrancy_guard.hpp>
#include <bobe/core/fmt/address_fmt.hpp> // NOLINT
#include <bobe/core/fmt/int_fmt.hpp> // NOLINT
#include <bobe/core/likely.h>
#include <bobe/swap/swap_contract.hpp>
#include <bobe/swap/swap_error.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <intx/intx.hpp>

#include <quill/Quill.h>

#include <utility>

BOBE_NAMESPACE_BEGIN

namespace
{
    uint256_t pow10(uint8_t const n)
    {
        return intx::exp(uint256_t{10}, uint256_t{n});
    }

    // rescales an amount with `decimals` fractional digits to 18
    Result<uint256_t>
    to_usd_decimals(uint256_t const &amount, uint8_t const decimals)
    {
        if (decimals <= USD_DECIMALS) {
            return checked_mul(
                amount, pow10(static_cast<uint8_t>(USD_DECIMALS - decimals)));
        }
        return amount / pow10(static_cast<uint8_t>(decimals - USD_DECIMALS));
    }
}

SwapContract::SwapContract(Clock const &clock, Address const &self)
    : clock_{clock}
    , self_{self}
{
}

/////////////////
//  Internals  //
/////////////////

Result<void> SwapContract::require_admin(Address const &sender) const
{
    if (BOBE_UNLIKELY(!initialized_)) {
        return SwapError::NotInitialized;
    }
    if (BOBE_UNLIKELY(!access_.has_role(Role::Admin, sender))) {
        return SwapError::Unauthorized;
    }
    return outcome::success();
}

Result<void> SwapContract::require_main_token() const
{
    if (BOBE_UNLIKELY(main_token_ == nullptr)) {
        return SwapError::MainTokenNotSet;
    }
    return outcome::success();
}

Result<uint256_t> SwapContract::oracle_price() const
{
    if (BOBE_UNLIKELY(price_feed_ == nullptr)) {
        return SwapError::PriceFeedNotSet;
    }
    auto const round = price_feed_->latest_round();
    if (BOBE_UNLIKELY(round.answer <= 0)) {
        return SwapError::InvalidPrice;
    }
    uint64_t const now = clock_.now();
    bool const stale =
        now > round.updated_at && now - round.updated_at > max_price_age_;
    if (BOBE_UNLIKELY(stale)) {
        LOG_WARNING(
            "SwapContract: price feed {} last updated {} seconds ago",
            price_feed_->address(),
            now - round.updated_at);
        return SwapError::StalePrice;
    }
    return to_usd_decimals(
        uint256_t{static_cast<uint64_t>(round.answer)},
        price_feed_->decimals());
}

Result<uint256_t> SwapContract::usd_value(
    Pricing const pricing, FungibleAsset const &asset,
    uint256_t const &amount) const
{
    BOOST_OUTCOME_TRY(
        auto const normalized, to_usd_decimals(amount, asset.decimals()));
    if (pricing == Pricing::Stable) {
        return normalized;
    }
    BOOST_OUTCOME_TRY(auto const price, oracle_price());
    return checked_mul_div(normalized, price, pow10(USD_DECIMALS));
}

Result<uint256_t> SwapContract::main_token_out(uint256_t const &usd) const
{
    BOOST_OUTCOME_TRY(require_main_token());
    return checked_mul_div(
        usd, pow10(main_token_->decimals()), main_token_price_);
}

Result<uint256_t> SwapContract::quote(
    Pricing const pricing, FungibleAsset const &asset,
    uint256_t const &amount) const
{
    BOOST_OUTCOME_TRY(auto const usd, usd_value(pricing, asset, amount));
    return main_token_out(usd);
}

Result<uint256_t> SwapContract::pull(
    FungibleAsset &asset, Address const &from, uint256_t const &amount)
{
    auto const before = asset.balance_of(funding_address_);
    BOOST_OUTCOME_TRY(
        asset.transfer_from(self_, from, funding_address_, amount));
    auto const after = asset.balance_of(funding_address_);
    if (BOBE_UNLIKELY(after <= before)) {
        return SwapError::TransferFailed;
    }
    auto const received = after - before;
    if (received < amount) {
        LOG_WARNING(
            "SwapContract: requested {} from {} but funding received {}",
            amount,
            from,
            received);
    }
    return received;
}

Result<uint256_t> SwapContract::swap(
    Pricing const pricing, Address const &sender, FungibleAsset &asset,
    uint256_t const &amount)
{
    if (BOBE_UNLIKELY(!initialized_)) {
        return SwapError::NotInitialized;
    }
    BOOST_OUTCOME_TRY(require_main_token());
    if (BOBE_UNLIKELY(amount == 0)) {
        return SwapError::InvalidAmount;
    }

    // The payment cannot be taken back once it reaches the funding address,
    // so the payout for the full amount must be covered before pulling.
    BOOST_OUTCOME_TRY(auto const max_out, quote(pricing, asset, amount));
    if (BOBE_UNLIKELY(max_out == 0)) {
        return SwapError::InvalidAmount;
    }
    if (BOBE_UNLIKELY(max_out > main_token_->balance_of(self_))) {
        return SwapError::InsufficientLiquidity;
    }

    BOOST_OUTCOME_TRY(auto const received, pull(asset, sender, amount));
    BOOST_OUTCOME_TRY(auto const out, quote(pricing, asset, received));
    BOOST_OUTCOME_TRY(main_token_->transfer(self_, sender, out));

    emit_log(EventBuilder(self_, "Swap")
                 .add_topic(sender)
                 .add_topic(asset.address())
                 .add_data(received)
                 .add_data(out)
                 .build());
    LOG_DEBUG(
        "SwapContract: {} paid {} of {} for {}",
        sender,
        received,
        asset.address(),
        out);
    return out;
}

void SwapContract::emit_log(Log &&log)
{
    logs_.push_back(std::move(log));
}

//////////////////////
//  Administration  //
//////////////////////

Result<void> SwapContract::initialize(
    Address const &admin, Address const &funding_address)
{
    if (BOBE_UNLIKELY(initialized_)) {
        return SwapError::AlreadyInitialized;
    }
    if (BOBE_UNLIKELY(admin == Address{} || funding_address == Address{})) {
        return SwapError::InvalidAddress;
    }
    access_.bootstrap(Role::Admin, admin);
    funding_address_ = funding_address;
    initialized_ = true;
    LOG_INFO(
        "SwapContract: initialized admin={} funding={}",
        admin,
        funding_address);
    return outcome::success();
}

Result<void>
SwapContract::set_main_token(Address const &sender, FungibleAsset &asset)
{
    BOOST_OUTCOME_TRY(require_admin(sender));
    if (BOBE_UNLIKELY(main_token_ != nullptr)) {
        return SwapError::MainTokenAlreadySet;
    }
    main_token_ = &asset;
    emit_log(
        EventBuilder(self_, "MainTokenSet").add_topic(asset.address()).build());
    return outcome::success();
}

Result<void> SwapContract::set_funding_address(
    Address const &sender, Address const &funding)
{
    BOOST_OUTCOME_TRY(require_admin(sender));
    if (BOBE_UNLIKELY(funding == Address{})) {
        return SwapError::InvalidAddress;
    }
    funding_address_ = funding;
    emit_log(
        EventBuilder(self_, "FundingAddressSet").add_topic(funding).build());
    return outcome::success();
}

Result<void> SwapContract::set_usdt(Address const &sender, FungibleAsset &asset)
{
    BOOST_OUTCOME_TRY(require_admin(sender));
    if (usdt_ != nullptr) {
        stable_tokens_.erase(usdt_->address());
    }
    usdt_ = &asset;
    stable_tokens_[asset.address()] = &asset;
    emit_log(EventBuilder(self_, "UsdtAddressSet")
                 .add_topic(asset.address())
                 .build());
    return outcome::success();
}

Result<void> SwapContract::set_price_feed(
    Address const &sender, FungibleAsset &oracle_asset, PriceFeed const &feed)
{
    BOOST_OUTCOME_TRY(require_admin(sender));
    if (BOBE_UNLIKELY(stable_tokens_.contains(oracle_asset.address()))) {
        return SwapError::UnsupportedAsset;
    }
    oracle_asset_ = &oracle_asset;
    price_feed_ = &feed;
    emit_log(EventBuilder(self_, "PriceFeedSet")
                 .add_topic(oracle_asset.address())
                 .add_topic(feed.address())
                 .build());
    return outcome::success();
}

Result<void> SwapContract::set_main_token_price_in_usdt(
    Address const &sender, uint256_t const &price)
{
    BOOST_OUTCOME_TRY(require_admin(sender));
    if (BOBE_UNLIKELY(price == 0)) {
        return SwapError::InvalidPrice;
    }
    main_token_price_ = price;
    emit_log(EventBuilder(self_, "MainTokenPriceSet").add_data(price).build());
    return outcome::success();
}

Result<void>
SwapContract::allow_stable_token(Address const &sender, FungibleAsset &asset)
{
    BOOST_OUTCOME_TRY(require_admin(sender));
    if (BOBE_UNLIKELY(
            oracle_asset_ != nullptr &&
            oracle_asset_->address() == asset.address())) {
        return SwapError::UnsupportedAsset;
    }
    stable_tokens_[asset.address()] = &asset;
    emit_log(EventBuilder(self_, "StableTokenAllowed")
                 .add_topic(asset.address())
                 .build());
    return outcome::success();
}

Result<void> SwapContract::disallow_stable_token(
    Address const &sender, FungibleAsset const &asset)
{
    BOOST_OUTCOME_TRY(require_admin(sender));
    if (BOBE_UNLIKELY(stable_tokens_.erase(asset.address()) == 0)) {
        return SwapError::UnsupportedAsset;
    }
    emit_log(EventBuilder(self_, "StableTokenDisallowed")
                 .add_topic(asset.address())
                 .build());
    return outcome::success();
}

Result<void>
SwapContract::set_max_price_age(Address const &sender, uint64_t const seconds)
{
    BOOST_OUTCOME_TRY(require_admin(sender));
    if (BOBE_UNLIKELY(seconds == 0)) {
        return SwapError::InvalidDuration;
    }
    max_price_age_ = seconds;
    emit_log(EventBuilder(self_, "MaxPriceAgeSet")
                 .add_data(uint256_t{seconds})
                 .build());
    return outcome::success();
}

Result<void> SwapContract::withdraw_main_token(
    Address const &sender, Address const &to, uint256_t const &amount)
{
    ReentrancyGuard const guard{busy_};
    if (BOBE_UNLIKELY(!guard.entered())) {
        return SwapError::Reentrancy;
    }
    BOOST_OUTCOME_TRY(require_admin(sender));
    BOOST_OUTCOME_TRY(require_main_token());
    if (BOBE_UNLIKELY(amount == 0)) {
        return SwapError::InvalidAmount;
    }
    if (BOBE_UNLIKELY(to == Address{})) {
        return SwapError::InvalidAddress;
    }
    if (BOBE_UNLIKELY(amount > main_token_->balance_of(self_))) {
        return SwapError::InsufficientLiquidity;
    }
    BOOST_OUTCOME_TRY(main_token_->transfer(self_, to, amount));
    emit_log(EventBuilder(self_, "MainTokenWithdrawn")
                 .add_topic(to)
                 .add_data(amount)
                 .build());
    return outcome::success();
}

/////////////
//  Swaps  //
/////////////

Result<uint256_t> SwapContract::swap_stable_tokens(
    Address const &sender, FungibleAsset &asset, uint256_t const &amount)
{
    ReentrancyGuard const guard{busy_};
    if (BOBE_UNLIKELY(!guard.entered())) {
        return SwapError::Reentrancy;
    }
    if (BOBE_UNLIKELY(!stable_tokens_.contains(asset.address()))) {
        return SwapError::UnsupportedAsset;
    }
    return swap(Pricing::Stable, sender, asset, amount);
}

Result<uint256_t> SwapContract::swap_oracle_asset(
    Address const &sender, FungibleAsset &asset, uint256_t const &amount)
{
    ReentrancyGuard const guard{busy_};
    if (BOBE_UNLIKELY(!guard.entered())) {
        return SwapError::Reentrancy;
    }
    if (BOBE_UNLIKELY(
            oracle_asset_ == nullptr ||
            oracle_asset_->address() != asset.address())) {
        return SwapError::UnsupportedAsset;
    }
    return swap(Pricing::Oracle, sender, asset, amount);
}

Result<uint256_t>
SwapContract::quote(FungibleAsset const &asset, uint256_t const &amount) const
{
    if (stable_tokens_.contains(asset.address())) {
        return quote(Pricing::Stable, asset, amount);
    }
    if (oracle_asset_ != nullptr &&
        oracle_asset_->address() == asset.address()) {
        return quote(Pricing::Oracle, asset, amount);
    }
    return SwapError::UnsupportedAsset;
}

BOBE_NAMESPACE_END
