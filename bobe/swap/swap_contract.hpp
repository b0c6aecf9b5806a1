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

#include <bobe/access/access_control.hpp>
#include <bobe/asset/fungible_asset.hpp>
#include <bobe/contract/events.hpp>
#include <bobe/core/address.hpp>
#include <bobe/core/clock.hpp>
#include <bobe/core/config.hpp>
#include <bobe/core/int.hpp>
#include <bobe/core/result.hpp>
#include <bobe/swap/price_feed.hpp>

#include <ankerl/unordered_dense.h>

#include <intx/intx.hpp>

#include <cstdint>
#include <vector>

BOBE_NAMESPACE_BEGIN

using namespace intx::literals;

// 1.1 USD, 18 decimals
inline constexpr uint256_t DEFAULT_MAIN_TOKEN_PRICE{1100000000000000000_u256};
inline constexpr uint64_t DEFAULT_MAX_PRICE_AGE{60 * 60};
inline constexpr uint8_t USD_DECIMALS{18};

// Sells the main token for stable coins at a fixed USD price, and for one
// oracle priced asset at its feed's latest USD price. Payments go straight
// to the funding address; the contract only ever holds the main token.
class SwapContract
{
public:
    enum class Pricing : uint8_t
    {
        Stable,
        Oracle,
    };

private:
    Clock const &clock_;
    Address self_;
    AccessControl access_;
    bool initialized_{false};
    bool busy_{false};

    Address funding_address_{};
    FungibleAsset *main_token_{nullptr};
    FungibleAsset *usdt_{nullptr};
    FungibleAsset *oracle_asset_{nullptr};
    PriceFeed const *price_feed_{nullptr};
    uint256_t main_token_price_{DEFAULT_MAIN_TOKEN_PRICE};
    uint64_t max_price_age_{DEFAULT_MAX_PRICE_AGE};

    ankerl::unordered_dense::map<Address, FungibleAsset *> stable_tokens_;

    std::vector<Log> logs_;

    Result<void> require_admin(Address const &) const;
    Result<void> require_main_token() const;

    // oracle price of the oracle asset, 18 decimals
    Result<uint256_t> oracle_price() const;
    Result<uint256_t> usd_value(
        Pricing, FungibleAsset const &, uint256_t const &amount) const;
    Result<uint256_t> main_token_out(uint256_t const &usd) const;
    Result<uint256_t> quote(
        Pricing, FungibleAsset const &, uint256_t const &amount) const;

    // pulls amount from a payer to the funding address, returns what arrived
    Result<uint256_t>
    pull(FungibleAsset &, Address const &from, uint256_t const &amount);
    Result<uint256_t> swap(
        Pricing, Address const &sender, FungibleAsset &,
        uint256_t const &amount);

    void emit_log(Log &&);

public:
    SwapContract(Clock const &, Address const &self);

    SwapContract(SwapContract const &) = delete;
    SwapContract &operator=(SwapContract const &) = delete;

    //////////////////////
    //  Administration  //
    //////////////////////

    Result<void>
    initialize(Address const &admin, Address const &funding_address);
    Result<void> set_main_token(Address const &sender, FungibleAsset &);
    Result<void>
    set_funding_address(Address const &sender, Address const &funding);
    // replaces the previous USDT, which stops being accepted
    Result<void> set_usdt(Address const &sender, FungibleAsset &);
    Result<void> set_price_feed(
        Address const &sender, FungibleAsset &oracle_asset, PriceFeed const &);
    Result<void> set_main_token_price_in_usdt(
        Address const &sender, uint256_t const &price);
    Result<void> allow_stable_token(Address const &sender, FungibleAsset &);
    Result<void>
    disallow_stable_token(Address const &sender, FungibleAsset const &);
    Result<void> set_max_price_age(Address const &sender, uint64_t seconds);
    Result<void> withdraw_main_token(
        Address const &sender, Address const &to, uint256_t const &amount);

    /////////////
    //  Swaps  //
    /////////////

    // both return the main token amount paid out
    Result<uint256_t> swap_stable_tokens(
        Address const &sender, FungibleAsset &, uint256_t const &amount);
    Result<uint256_t> swap_oracle_asset(
        Address const &sender, FungibleAsset &, uint256_t const &amount);

    // main token amount a swap of amount would pay out now
    Result<uint256_t>
    quote(FungibleAsset const &, uint256_t const &amount) const;

    /////////////////
    //  Accessors  //
    /////////////////

    Address const &address() const noexcept
    {
        return self_;
    }

    Address const &funding_address() const noexcept
    {
        return funding_address_;
    }

    FungibleAsset const *main_token() const noexcept
    {
        return main_token_;
    }

    FungibleAsset const *usdt() const noexcept
    {
        return usdt_;
    }

    FungibleAsset const *oracle_asset() const noexcept
    {
        return oracle_asset_;
    }

    PriceFeed const *price_feed() const noexcept
    {
        return price_feed_;
    }

    uint256_t const &main_token_price_in_usdt() const noexcept
    {
        return main_token_price_;
    }

    uint64_t max_price_age() const noexcept
    {
        return max_price_age_;
    }

    bool is_stable_token_allowed(Address const &asset) const
    {
        return stable_tokens_.contains(asset);
    }

    AccessControl &access() noexcept
    {
        return access_;
    }

    AccessControl const &access() const noexcept
    {
        return access_;
    }

    std::vector<Log> const &logs() const noexcept
    {
        return logs_;
    }
};

BOBE_NAMESPACE_END
