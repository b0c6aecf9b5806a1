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

#include <bobe/contract/checked_math.hpp>
#include <bobe/contract/events.hpp>
#include <bobe/contract/reentrancy_guard.hpp>
#include <bobe/core/assert.h>
#include <bobe/core/fmt/address_fmt.hpp> // NOLINT
#include <bobe/core/fmt/int_fmt.hpp> // NOLINT
#include <bobe/core/likely.h>
#include <bobe/staking/staking_contract.hpp>
#include <bobe/staking/util/accrual.hpp>
#include <bobe/staking/util/constants.hpp>
#include <bobe/staking/util/staking_error.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

#include <utility>

BOBE_STAKING_NAMESPACE_BEGIN

StakingContract::StakingContract(Clock const &clock, Address const &self)
    : clock_{clock}
    , self_{self}
{
}

/////////////////
//  Internals  //
/////////////////

Result<void>
StakingContract::require(Role const role, Address const &sender) const
{
    if (BOBE_UNLIKELY(!initialized_)) {
        return StakingError::NotInitialized;
    }
    if (BOBE_UNLIKELY(!access_.has_role(role, sender))) {
        return StakingError::Unauthorized;
    }
    return outcome::success();
}

Result<void> StakingContract::require_tokens() const
{
    if (BOBE_UNLIKELY(staking_asset_ == nullptr || reward_asset_ == nullptr)) {
        return StakingError::TokensNotSet;
    }
    return outcome::success();
}

Result<void>
StakingContract::advance_global(StakingVars &vars, uint64_t const now) const
{
    if (vars.global_stake == 0) {
        uint64_t const idle =
            overlap(vars.campaign, vars.accrual.last_update_time, now);
        if (idle != 0) {
            LOG_WARNING(
                "StakingContract: {} seconds of campaign emission left "
                "undistributed, nothing staked",
                idle);
        }
    }
    return advance(vars.accrual, vars.campaign, vars.global_stake, now);
}

Result<void> StakingContract::advance_user(
    StakerLedger &ledger, AccrualIndex const &acc) const
{
    BOOST_OUTCOME_TRY(
        auto const accrued,
        accrued_rewards(ledger.stake, acc.index, ledger.index_snapshot));
    BOOST_OUTCOME_TRY(
        auto const unclaimed, checked_add(ledger.unclaimed_rewards, accrued));
    ledger.unclaimed_rewards = unclaimed;
    ledger.index_snapshot = acc.index;
    return outcome::success();
}

StakerLedger StakingContract::ledger_of(Address const &address) const
{
    auto const it = stakers_.find(address);
    return it == stakers_.end() ? StakerLedger{} : it->second.ledger;
}

Staker const *StakingContract::staker(Address const &address) const
{
    auto const it = stakers_.find(address);
    return it == stakers_.end() ? nullptr : &it->second;
}

Result<uint256_t> StakingContract::pending_at(
    StakerLedger const &ledger, AccrualIndex const &acc) const
{
    BOOST_OUTCOME_TRY(
        auto const accrued,
        accrued_rewards(ledger.stake, acc.index, ledger.index_snapshot));
    return checked_add(ledger.unclaimed_rewards, accrued);
}

Result<uint256_t> StakingContract::pull(
    FungibleAsset &asset, Address const &from, uint256_t const &amount)
{
    auto const before = asset.balance_of(self_);
    BOOST_OUTCOME_TRY(asset.transfer_from(self_, from, self_, amount));
    auto const after = asset.balance_of(self_);
    if (BOBE_UNLIKELY(after <= before)) {
        return StakingError::TransferFailed;
    }
    auto const credited = after - before;
    if (credited < amount) {
        LOG_WARNING(
            "StakingContract: requested {} from {} but received {}",
            amount,
            from,
            credited);
    }
    return credited;
}

void StakingContract::emit_log(Log &&log)
{
    logs_.push_back(std::move(log));
}

//////////////////////
//  Administration  //
//////////////////////

Result<void> StakingContract::initialize(
    Address const &admin, Address const &announcer)
{
    ReentrancyGuard const guard{busy_};
    if (BOBE_UNLIKELY(!guard.entered())) {
        return StakingError::Reentrancy;
    }
    if (BOBE_UNLIKELY(initialized_)) {
        return StakingError::AlreadyInitialized;
    }
    access_.bootstrap(Role::Admin, admin);
    if (announcer != Address{}) {
        access_.bootstrap(Role::Announcer, announcer);
    }
    initialized_ = true;
    LOG_INFO(
        "StakingContract: initialized admin={} announcer={}", admin, announcer);
    return outcome::success();
}

Result<void> StakingContract::set_token_addresses(
    Address const &sender, FungibleAsset &staking_asset,
    FungibleAsset &reward_asset)
{
    ReentrancyGuard const guard{busy_};
    if (BOBE_UNLIKELY(!guard.entered())) {
        return StakingError::Reentrancy;
    }
    BOOST_OUTCOME_TRY(require(Role::Admin, sender));
    if (BOBE_UNLIKELY(staking_asset_ != nullptr)) {
        return StakingError::TokensAlreadySet;
    }
    if (BOBE_UNLIKELY(staking_asset.address() == reward_asset.address())) {
        return StakingError::SameToken;
    }
    staking_asset_ = &staking_asset;
    reward_asset_ = &reward_asset;
    emit_log(EventBuilder(self_, "TokenAddressesSet")
                 .add_topic(staking_asset.address())
                 .add_topic(reward_asset.address())
                 .build());
    return outcome::success();
}

Result<void> StakingContract::set_campaign_duration(
    Address const &sender, uint64_t const seconds)
{
    ReentrancyGuard const guard{busy_};
    if (BOBE_UNLIKELY(!guard.entered())) {
        return StakingError::Reentrancy;
    }
    BOOST_OUTCOME_TRY(require(Role::Admin, sender));
    if (BOBE_UNLIKELY(seconds == 0)) {
        return StakingError::InvalidDuration;
    }
    if (BOBE_UNLIKELY(seconds > MAX_CAMPAIGN_DURATION)) {
        return StakingError::DurationTooLong;
    }
    vars_.campaign_duration = seconds;
    emit_log(EventBuilder(self_, "CampaignDurationSet")
                 .add_data(uint256_t{seconds})
                 .build());
    return outcome::success();
}

Result<void> StakingContract::set_unstake_period(
    Address const &sender, uint64_t const seconds)
{
    ReentrancyGuard const guard{busy_};
    if (BOBE_UNLIKELY(!guard.entered())) {
        return StakingError::Reentrancy;
    }
    BOOST_OUTCOME_TRY(require(Role::Admin, sender));
    if (BOBE_UNLIKELY(seconds == 0)) {
        return StakingError::InvalidDuration;
    }
    if (BOBE_UNLIKELY(seconds > MAX_UNSTAKE_PERIOD)) {
        return StakingError::DurationTooLong;
    }
    vars_.unstake_period = seconds;
    emit_log(EventBuilder(self_, "UnstakePeriodSet")
                 .add_data(uint256_t{seconds})
                 .build());
    return outcome::success();
}

////////////////
//  Treasury  //
////////////////

Result<uint256_t>
StakingContract::deposit(Address const &sender, uint256_t const &amount)
{
    ReentrancyGuard const guard{busy_};
    if (BOBE_UNLIKELY(!guard.entered())) {
        return StakingError::Reentrancy;
    }
    return deposit_unguarded(sender, amount);
}

Result<uint256_t> StakingContract::deposit_unguarded(
    Address const &sender, uint256_t const &amount)
{
    BOOST_OUTCOME_TRY(require(Role::Announcer, sender));
    BOOST_OUTCOME_TRY(require_tokens());
    if (BOBE_UNLIKELY(amount == 0)) {
        return StakingError::InvalidAmount;
    }
    BOOST_OUTCOME_TRY(
        auto const credited, pull(*reward_asset_, sender, amount));
    BOOST_OUTCOME_TRY(
        auto const deposited, checked_add(vars_.treasury.deposited, credited));
    vars_.treasury.deposited = deposited;
    emit_log(EventBuilder(self_, "Deposit")
                 .add_topic(sender)
                 .add_data(credited)
                 .build());
    LOG_DEBUG("StakingContract: {} deposited {}", sender, credited);
    return credited;
}

Result<void> StakingContract::withdraw(
    Address const &sender, FungibleAsset &asset, uint256_t const &amount)
{
    ReentrancyGuard const guard{busy_};
    if (BOBE_UNLIKELY(!guard.entered())) {
        return StakingError::Reentrancy;
    }
    BOOST_OUTCOME_TRY(require(Role::Admin, sender));
    if (BOBE_UNLIKELY(amount == 0)) {
        return StakingError::InvalidAmount;
    }
    if (BOBE_UNLIKELY(asset.address() == Address{})) {
        return StakingError::UnknownAsset;
    }

    StakingVars const prev = vars_;
    if (reward_asset_ != nullptr &&
        asset.address() == reward_asset_->address()) {
        auto const available = saturating_sub(
            vars_.treasury.deposited, vars_.treasury.total_rewards_committed);
        if (BOBE_UNLIKELY(amount > available)) {
            return StakingError::InsufficientTreasury;
        }
        vars_.treasury.deposited -= amount;
    }
    else if (
        staking_asset_ != nullptr &&
        asset.address() == staking_asset_->address()) {
        auto const surplus =
            saturating_sub(asset.balance_of(self_), vars_.global_stake);
        if (BOBE_UNLIKELY(amount > surplus)) {
            return StakingError::InsufficientTreasury;
        }
    }

    if (auto res = asset.transfer(self_, sender, amount); res.has_error()) {
        vars_ = prev;
        LOG_WARNING(
            "StakingContract: withdraw of {} to {} failed: {}",
            amount,
            sender,
            res.error().message().c_str());
        return std::move(res).as_failure();
    }
    emit_log(EventBuilder(self_, "Withdraw")
                 .add_topic(sender)
                 .add_topic(asset.address())
                 .add_data(amount)
                 .build());
    return outcome::success();
}

/////////////////
//  Campaigns  //
/////////////////

Result<void> StakingContract::check_announce(
    Address const &sender, uint64_t const now) const
{
    BOOST_OUTCOME_TRY(require(Role::Announcer, sender));
    BOOST_OUTCOME_TRY(require_tokens());
    if (BOBE_UNLIKELY(!vars_.campaign.finished(now))) {
        return StakingError::CampaignActive;
    }
    return outcome::success();
}

Result<void>
StakingContract::announce(Address const &sender, uint256_t const &reward_amount)
{
    ReentrancyGuard const guard{busy_};
    if (BOBE_UNLIKELY(!guard.entered())) {
        return StakingError::Reentrancy;
    }
    return announce_unguarded(sender, reward_amount, clock_.now());
}

Result<void> StakingContract::announce_unguarded(
    Address const &sender, uint256_t const &reward_amount, uint64_t const now)
{
    BOOST_OUTCOME_TRY(check_announce(sender, now));
    if (BOBE_UNLIKELY(reward_amount == 0)) {
        return StakingError::InvalidAmount;
    }

    StakingVars next = vars_;
    // flush the previous campaign into the index before replacing it
    BOOST_OUTCOME_TRY(advance_global(next, now));

    auto const unreleased =
        saturating_sub(next.treasury.deposited, next.accrual.distributed());
    if (BOBE_UNLIKELY(unreleased < reward_amount)) {
        return StakingError::InsufficientDeposit;
    }
    BOOST_OUTCOME_TRY(
        auto const committed,
        checked_add(next.treasury.total_rewards_committed, reward_amount));
    next.treasury.total_rewards_committed = committed;
    next.campaign = Campaign{
        .start_time = now,
        .finish_time = now + next.campaign_duration,
        .reward_amount = reward_amount};

    vars_ = next;
    emit_log(EventBuilder(self_, "Announce")
                 .add_topic(sender)
                 .add_data(reward_amount)
                 .add_data(uint256_t{vars_.campaign.start_time})
                 .add_data(uint256_t{vars_.campaign.finish_time})
                 .build());
    LOG_DEBUG(
        "StakingContract: campaign of {} announced for [{}, {})",
        reward_amount,
        vars_.campaign.start_time,
        vars_.campaign.finish_time);
    return outcome::success();
}

Result<void> StakingContract::deposit_and_announce(
    Address const &sender, uint256_t const &amount)
{
    ReentrancyGuard const guard{busy_};
    if (BOBE_UNLIKELY(!guard.entered())) {
        return StakingError::Reentrancy;
    }
    if (BOBE_UNLIKELY(amount == 0)) {
        return StakingError::InvalidAmount;
    }
    // every announce check that does not depend on the deposit runs first,
    // so a rejected announce never leaves a deposit behind
    uint64_t const now = clock_.now();
    BOOST_OUTCOME_TRY(check_announce(sender, now));
    BOOST_OUTCOME_TRY(auto const credited, deposit_unguarded(sender, amount));
    return announce_unguarded(sender, credited, now);
}

///////////////
//  Stakers  //
///////////////

Result<uint256_t>
StakingContract::stake(Address const &sender, uint256_t const &amount)
{
    ReentrancyGuard const guard{busy_};
    if (BOBE_UNLIKELY(!guard.entered())) {
        return StakingError::Reentrancy;
    }
    BOOST_OUTCOME_TRY(require_tokens());
    if (BOBE_UNLIKELY(amount == 0)) {
        return StakingError::InvalidAmount;
    }

    uint64_t const now = clock_.now();
    StakingVars next = vars_;
    BOOST_OUTCOME_TRY(advance_global(next, now));
    StakerLedger ledger = ledger_of(sender);
    BOOST_OUTCOME_TRY(advance_user(ledger, next.accrual));

    BOOST_OUTCOME_TRY(
        auto const credited, pull(*staking_asset_, sender, amount));

    BOOST_OUTCOME_TRY(
        auto const global_stake, checked_add(next.global_stake, credited));
    BOOST_OUTCOME_TRY(
        auto const local_stake, checked_add(ledger.stake, credited));
    next.global_stake = global_stake;
    ledger.stake = local_stake;

    vars_ = next;
    Staker &staker = stakers_[sender];
    staker.ledger = ledger;
    staker.timelock.append(credited, now);
    if (registry_.add(sender)) {
        LOG_DEBUG("StakingContract: new staker {}", sender);
    }

    emit_log(EventBuilder(self_, "Stake")
                 .add_topic(sender)
                 .add_data(credited)
                 .build());
    return credited;
}

Result<void>
StakingContract::unstake(Address const &sender, uint256_t const &amount)
{
    ReentrancyGuard const guard{busy_};
    if (BOBE_UNLIKELY(!guard.entered())) {
        return StakingError::Reentrancy;
    }
    BOOST_OUTCOME_TRY(require_tokens());
    if (BOBE_UNLIKELY(amount == 0)) {
        return StakingError::InvalidAmount;
    }

    uint64_t const now = clock_.now();
    auto const it = stakers_.find(sender);
    if (BOBE_UNLIKELY(it == stakers_.end())) {
        return StakingError::InsufficientUnlockedPrincipal;
    }
    auto const unlockable = it->second.timelock.unlockable(
        now, vars_.unstake_period, it->second.ledger.total_unstaked);
    if (BOBE_UNLIKELY(amount > unlockable)) {
        return StakingError::InsufficientUnlockedPrincipal;
    }

    StakingVars next = vars_;
    BOOST_OUTCOME_TRY(advance_global(next, now));
    StakerLedger ledger = it->second.ledger;
    BOOST_OUTCOME_TRY(advance_user(ledger, next.accrual));

    // unlockable principal is never more than what is staked
    BOBE_ASSERT(ledger.stake >= amount);
    BOBE_ASSERT(next.global_stake >= amount);
    ledger.stake -= amount;
    next.global_stake -= amount;
    ledger.total_unstaked += amount;

    StakingVars const prev_vars = vars_;
    StakerLedger const prev_ledger = it->second.ledger;
    vars_ = next;
    it->second.ledger = ledger;

    if (auto res = staking_asset_->transfer(self_, sender, amount);
        res.has_error()) {
        vars_ = prev_vars;
        stakers_[sender].ledger = prev_ledger;
        LOG_WARNING(
            "StakingContract: unstake payout of {} to {} failed: {}",
            amount,
            sender,
            res.error().message().c_str());
        return std::move(res).as_failure();
    }

    emit_log(EventBuilder(self_, "Unstake")
                 .add_topic(sender)
                 .add_data(amount)
                 .build());
    return outcome::success();
}

Result<uint256_t> StakingContract::claim_rewards(Address const &sender)
{
    ReentrancyGuard const guard{busy_};
    if (BOBE_UNLIKELY(!guard.entered())) {
        return StakingError::Reentrancy;
    }
    BOOST_OUTCOME_TRY(require_tokens());

    uint64_t const now = clock_.now();
    StakingVars next = vars_;
    BOOST_OUTCOME_TRY(advance_global(next, now));
    StakerLedger ledger = ledger_of(sender);
    BOOST_OUTCOME_TRY(advance_user(ledger, next.accrual));

    auto const reward = ledger.unclaimed_rewards;
    if (BOBE_UNLIKELY(reward == 0)) {
        return StakingError::NoRewardsAvailable;
    }
    BOOST_OUTCOME_TRY(
        auto const total_claimed, checked_add(ledger.total_claimed, reward));
    ledger.unclaimed_rewards = 0;
    ledger.total_claimed = total_claimed;

    // a non zero reward implies the sender has staked before
    auto const it = stakers_.find(sender);
    BOBE_ASSERT(it != stakers_.end());
    StakingVars const prev_vars = vars_;
    StakerLedger const prev_ledger = it->second.ledger;
    vars_ = next;
    it->second.ledger = ledger;

    if (auto res = reward_asset_->transfer(self_, sender, reward);
        res.has_error()) {
        vars_ = prev_vars;
        stakers_[sender].ledger = prev_ledger;
        LOG_WARNING(
            "StakingContract: reward payout of {} to {} failed: {}",
            reward,
            sender,
            res.error().message().c_str());
        return std::move(res).as_failure();
    }

    emit_log(EventBuilder(self_, "ClaimRewards")
                 .add_topic(sender)
                 .add_data(reward)
                 .build());
    return reward;
}

/////////////
//  Views  //
/////////////

Result<uint256_t> StakingContract::current_index() const
{
    BOOST_OUTCOME_TRY(
        auto const acc,
        project(
            vars_.accrual, vars_.campaign, vars_.global_stake, clock_.now()));
    return acc.index;
}

Result<uint256_t> StakingContract::pending_rewards(Address const &user) const
{
    BOOST_OUTCOME_TRY(
        auto const acc,
        project(
            vars_.accrual, vars_.campaign, vars_.global_stake, clock_.now()));
    return pending_at(ledger_of(user), acc);
}

uint256_t StakingContract::get_unlockable_amount(Address const &user) const
{
    auto const it = stakers_.find(user);
    if (it == stakers_.end()) {
        return 0;
    }
    return it->second.timelock.unlockable(
        clock_.now(), vars_.unstake_period, it->second.ledger.total_unstaked);
}

Result<UserStats> StakingContract::get_user_stats(Address const &user) const
{
    uint64_t const now = clock_.now();
    BOOST_OUTCOME_TRY(
        auto const acc,
        project(vars_.accrual, vars_.campaign, vars_.global_stake, now));
    StakerLedger const ledger = ledger_of(user);

    BOOST_OUTCOME_TRY(auto const pending, pending_at(ledger, acc));

    UserStats stats{};
    stats.current_stake = ledger.stake;
    stats.pending_rewards = pending;
    stats.total_claimed = ledger.total_claimed;
    if (vars_.campaign.active(now)) {
        BOOST_OUTCOME_TRY(
            auto const rate,
            rewards_per_second(
                vars_.campaign, ledger.stake, vars_.global_stake));
        stats.rewards_per_second = rate;
    }
    if (auto const it = stakers_.find(user); it != stakers_.end()) {
        for (auto const &deposit : it->second.timelock.deposits()) {
            stats.stake_amounts.push_back(deposit.amount);
            stats.stake_times.push_back(deposit.timestamp);
        }
        stats.unlocked_amount = it->second.timelock.unlockable(
            now, vars_.unstake_period, ledger.total_unstaked);
    }
    stats.total_unstaked = ledger.total_unstaked;
    stats.unstake_period = vars_.unstake_period;
    if (staking_asset_ != nullptr) {
        stats.token_balance = staking_asset_->balance_of(user);
    }
    return stats;
}

Result<GlobalStats> StakingContract::get_global_stats() const
{
    uint64_t const now = clock_.now();
    BOOST_OUTCOME_TRY(
        auto const acc,
        project(vars_.accrual, vars_.campaign, vars_.global_stake, now));

    GlobalStats stats{};
    stats.total_staked = vars_.global_stake;
    stats.total_stakers = registry_.size();
    for (auto const &address : registry_.all()) {
        if (ledger_of(address).stake != 0) {
            ++stats.active_stakers;
        }
    }
    stats.total_distributed = acc.distributed();
    stats.available_bank = saturating_sub(
        vars_.treasury.deposited, vars_.treasury.total_rewards_committed);
    stats.current_campaign_rewards = vars_.campaign.reward_amount;
    stats.campaign_start = vars_.campaign.start_time;
    stats.campaign_end = vars_.campaign.finish_time;
    if (vars_.campaign.active(now)) {
        BOOST_OUTCOME_TRY(
            auto const rate,
            reward_rate_per_token(vars_.campaign, vars_.global_stake));
        stats.reward_rate_per_token = rate;
    }
    return stats;
}

Result<AvailableRewards> StakingContract::get_available_rewards() const
{
    BOOST_OUTCOME_TRY(
        auto const acc,
        project(
            vars_.accrual, vars_.campaign, vars_.global_stake, clock_.now()));
    auto const distributed = acc.distributed();
    return AvailableRewards{
        .distributed = distributed,
        .available = saturating_sub(vars_.treasury.deposited, distributed)};
}

Result<RewardsBatch>
StakingContract::collect(std::span<Address const> const addresses) const
{
    BOOST_OUTCOME_TRY(
        auto const acc,
        project(
            vars_.accrual, vars_.campaign, vars_.global_stake, clock_.now()));

    RewardsBatch batch;
    batch.stakers.reserve(addresses.size());
    batch.rewards.reserve(addresses.size());
    batch.claimed.reserve(addresses.size());
    batch.total.reserve(addresses.size());
    batch.stakes.reserve(addresses.size());
    for (auto const &address : addresses) {
        StakerLedger const ledger = ledger_of(address);
        BOOST_OUTCOME_TRY(auto const pending, pending_at(ledger, acc));
        BOOST_OUTCOME_TRY(
            auto const total, checked_add(pending, ledger.total_claimed));
        batch.stakers.push_back(address);
        batch.rewards.push_back(pending);
        batch.claimed.push_back(ledger.total_claimed);
        batch.total.push_back(total);
        batch.stakes.push_back(ledger.stake);
    }
    return batch;
}

Result<RewardsBatch> StakingContract::get_stakers_rewards_batch(
    size_t const offset, size_t const batch_size) const
{
    if (BOBE_UNLIKELY(batch_size == 0)) {
        return StakingError::InvalidBatchSize;
    }
    if (registry_.empty() && offset == 0) {
        return RewardsBatch{};
    }
    if (BOBE_UNLIKELY(offset >= registry_.size())) {
        return StakingError::OutOfBounds;
    }
    return collect(registry_.slice(offset, batch_size));
}

Result<RewardsBatch> StakingContract::get_rewards_by_addresses(
    std::span<Address const> const addresses) const
{
    if (BOBE_UNLIKELY(addresses.empty())) {
        return StakingError::EmptyAddressList;
    }
    return collect(addresses);
}

BOBE_STAKING_NAMESPACE_END
