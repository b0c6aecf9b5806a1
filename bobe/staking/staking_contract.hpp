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
#include <bobe/core/int.hpp>
#include <bobe/core/result.hpp>
#include <bobe/staking/config.hpp>
#include <bobe/staking/util/accrual.hpp>
#include <bobe/staking/util/campaign.hpp>
#include <bobe/staking/util/constants.hpp>
#include <bobe/staking/util/staker.hpp>
#include <bobe/staking/util/staker_registry.hpp>
#include <bobe/staking/util/staking_error.hpp>

#include <ankerl/unordered_dense.h>

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

BOBE_STAKING_NAMESPACE_BEGIN

// Reward asset held for campaigns
struct Treasury
{
    uint256_t deposited{0};
    // cumulative reward promised by every announced campaign
    uint256_t total_rewards_committed{0};

    friend bool operator==(Treasury const &, Treasury const &) = default;
};

// Every contract wide scalar. Trivially copyable: entry points snapshot it
// before paying out and restore it if the payout fails.
struct StakingVars
{
    Campaign campaign{};
    AccrualIndex accrual{};
    uint256_t global_stake{0};
    Treasury treasury{};
    uint64_t campaign_duration{DEFAULT_CAMPAIGN_DURATION};
    uint64_t unstake_period{DEFAULT_UNSTAKE_PERIOD};

    friend bool
    operator==(StakingVars const &, StakingVars const &) = default;
};

struct UserStats
{
    uint256_t current_stake;
    uint256_t pending_rewards;
    uint256_t total_claimed;
    uint256_t rewards_per_second;
    std::vector<uint256_t> stake_amounts;
    std::vector<uint64_t> stake_times;
    uint256_t unlocked_amount;
    uint256_t total_unstaked;
    uint64_t unstake_period;
    uint256_t token_balance;
};

struct GlobalStats
{
    uint256_t total_staked;
    uint64_t total_stakers;
    uint64_t active_stakers;
    uint256_t total_distributed;
    uint256_t available_bank;
    uint256_t current_campaign_rewards;
    uint64_t campaign_start;
    uint64_t campaign_end;
    uint256_t reward_rate_per_token;
};

struct AvailableRewards
{
    // released to stakers so far
    uint256_t distributed;
    // deposited and not yet released
    uint256_t available;
};

// Parallel arrays, one slot per staker
struct RewardsBatch
{
    std::vector<Address> stakers;
    std::vector<uint256_t> rewards;
    std::vector<uint256_t> claimed;
    std::vector<uint256_t> total;
    std::vector<uint256_t> stakes;
};

class StakingContract
{
    Clock const &clock_;
    Address self_;
    AccessControl access_;
    bool initialized_{false};
    bool busy_{false};

    FungibleAsset *staking_asset_{nullptr};
    FungibleAsset *reward_asset_{nullptr};

    StakingVars vars_{};
    ankerl::unordered_dense::map<Address, Staker> stakers_;
    StakerRegistry registry_;

    std::vector<Log> logs_;

    Result<void> require(Role, Address const &) const;
    Result<void> require_tokens() const;

    // Both operate on copies; an entry point commits them only once every
    // check and pull has succeeded.
    Result<void> advance_global(StakingVars &, uint64_t now) const;
    Result<void> advance_user(StakerLedger &, AccrualIndex const &) const;

    StakerLedger ledger_of(Address const &) const;
    Result<uint256_t> pending_at(
        StakerLedger const &, AccrualIndex const &) const;

    // pulls amount from `from`, returns what actually arrived
    Result<uint256_t>
    pull(FungibleAsset &, Address const &from, uint256_t const &amount);

    Result<uint256_t>
    deposit_unguarded(Address const &sender, uint256_t const &amount);
    Result<void> announce_unguarded(
        Address const &sender, uint256_t const &reward_amount, uint64_t now);
    Result<void> check_announce(Address const &sender, uint64_t now) const;

    Result<RewardsBatch> collect(std::span<Address const>) const;

    void emit_log(Log &&);

public:
    StakingContract(Clock const &, Address const &self);

    StakingContract(StakingContract const &) = delete;
    StakingContract &operator=(StakingContract const &) = delete;

    //////////////////////
    //  Administration  //
    //////////////////////

    Result<void>
    initialize(Address const &admin, Address const &announcer);
    Result<void> set_token_addresses(
        Address const &sender, FungibleAsset &staking_asset,
        FungibleAsset &reward_asset);
    // applies to the next campaign
    Result<void>
    set_campaign_duration(Address const &sender, uint64_t seconds);
    // applies to every deposit, past and future
    Result<void> set_unstake_period(Address const &sender, uint64_t seconds);

    ////////////////
    //  Treasury  //
    ////////////////

    // returns the credited amount
    Result<uint256_t> deposit(Address const &sender, uint256_t const &amount);
    // Sends `amount` of `asset` to the sender. The reward asset is bounded by
    // the uncommitted treasury, the staking asset by the surplus over the
    // global stake; any other asset can be rescued in full.
    Result<void> withdraw(
        Address const &sender, FungibleAsset &asset, uint256_t const &amount);

    /////////////////
    //  Campaigns  //
    /////////////////

    Result<void>
    announce(Address const &sender, uint256_t const &reward_amount);
    Result<void>
    deposit_and_announce(Address const &sender, uint256_t const &amount);

    ///////////////
    //  Stakers  //
    ///////////////

    // returns the credited amount
    Result<uint256_t> stake(Address const &sender, uint256_t const &amount);
    Result<void> unstake(Address const &sender, uint256_t const &amount);
    // returns the amount paid
    Result<uint256_t> claim_rewards(Address const &sender);

    /////////////
    //  Views  //
    /////////////

    Result<uint256_t> current_index() const;
    Result<uint256_t> pending_rewards(Address const &) const;
    uint256_t get_unlockable_amount(Address const &) const;
    Result<UserStats> get_user_stats(Address const &) const;
    Result<GlobalStats> get_global_stats() const;
    Result<AvailableRewards> get_available_rewards() const;
    Result<RewardsBatch>
    get_stakers_rewards_batch(size_t offset, size_t batch_size) const;
    Result<RewardsBatch>
    get_rewards_by_addresses(std::span<Address const>) const;

    /////////////////
    //  Accessors  //
    /////////////////

    Address const &address() const noexcept
    {
        return self_;
    }

    StakingVars const &vars() const noexcept
    {
        return vars_;
    }

    Campaign const &campaign() const noexcept
    {
        return vars_.campaign;
    }

    uint256_t const &global_stake() const noexcept
    {
        return vars_.global_stake;
    }

    uint256_t const &global_index() const noexcept
    {
        return vars_.accrual.index;
    }

    uint64_t last_update_time() const noexcept
    {
        return vars_.accrual.last_update_time;
    }

    uint256_t const &deposited() const noexcept
    {
        return vars_.treasury.deposited;
    }

    // released as of the last index advance
    uint256_t distributed() const
    {
        return vars_.accrual.distributed();
    }

    uint256_t const &total_rewards_committed() const noexcept
    {
        return vars_.treasury.total_rewards_committed;
    }

    uint64_t campaign_duration() const noexcept
    {
        return vars_.campaign_duration;
    }

    uint64_t unstake_period() const noexcept
    {
        return vars_.unstake_period;
    }

    FungibleAsset const *staking_asset() const noexcept
    {
        return staking_asset_;
    }

    FungibleAsset const *reward_asset() const noexcept
    {
        return reward_asset_;
    }

    StakerRegistry const &registry() const noexcept
    {
        return registry_;
    }

    // nullptr if the address never staked
    Staker const *staker(Address const &) const;

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

BOBE_STAKING_NAMESPACE_END
