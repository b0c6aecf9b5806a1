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

#include "replay.hpp"
#include "from_json.hpp"

#include <bobe/asset/token.hpp>
#include <bobe/core/address.hpp>
#include <bobe/core/bobe_exception.hpp>
#include <bobe/core/fmt/address_fmt.hpp> // NOLINT
#include <bobe/core/fmt/int_fmt.hpp> // NOLINT
#include <bobe/core/int.hpp>
#include <bobe/core/result.hpp>
#include <bobe/staking/staking_contract.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <nlohmann/json.hpp>
#include <quill/Quill.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

using namespace bobe;
using namespace bobe::staking;

namespace
{
    std::unique_ptr<Token> make_token(nlohmann::json const &j)
    {
        return std::make_unique<Token>(
            j.at("address").get<Address>(),
            j.at("name").get<std::string>(),
            j.at("symbol").get<std::string>(),
            j.value("decimals", uint8_t{18}));
    }
}

Replay::Replay(nlohmann::json const &scenario)
    : clock_{scenario.at("start_time").get<uint64_t>()}
    , staking_token_{make_token(scenario.at("staking_token"))}
    , reward_token_{make_token(scenario.at("reward_token"))}
    , commands_{scenario.value("commands", nlohmann::json::array())}
{
    for (auto const &[name, address] : scenario.at("accounts").items()) {
        accounts_[name] = address.get<Address>();
    }

    Address const self = scenario.contains("contract")
                             ? scenario.at("contract").get<Address>()
                             : Address{0x1000};
    contract_ = std::make_unique<StakingContract>(clock_, self);

    auto const &admin = account(scenario.at("admin"));
    Address announcer{};
    if (scenario.contains("announcer")) {
        announcer = account(scenario.at("announcer"));
    }
    BOBE_THROW(
        !contract_->initialize(admin, announcer).has_error(),
        "could not initialize the staking contract");
    BOBE_THROW(
        !contract_
             ->set_token_addresses(admin, *staking_token_, *reward_token_)
             .has_error(),
        "staking and reward token must differ");

    for (auto const &mint :
         scenario.value("mints", nlohmann::json::array())) {
        auto &asset = token(mint.at("token"));
        auto const &to = account(mint.at("to"));
        BOBE_THROW(
            !asset.mint(to, mint.at("amount").get<uint256_t>()).has_error(),
            "mint failed");
        asset.approve(to, contract_->address(), UINT256_MAX);
    }
}

Address const &Replay::account(nlohmann::json const &name) const
{
    auto const it = accounts_.find(name.get<std::string>());
    BOBE_THROW(it != accounts_.end(), "unknown account");
    return it->second;
}

Token &Replay::token(nlohmann::json const &which)
{
    auto const name = which.get<std::string>();
    if (name == "staking") {
        return *staking_token_;
    }
    BOBE_THROW(name == "reward", "token must be staking or reward");
    return *reward_token_;
}

Result<void> Replay::execute(nlohmann::json const &command)
{
    auto const op = command.at("op").get<std::string>();

    if (op == "advance_time") {
        clock_.advance(command.at("seconds").get<uint64_t>());
        return outcome::success();
    }
    if (op == "print_global") {
        print_global();
        return outcome::success();
    }
    if (op == "print_user") {
        print_user(account(command.at("account")));
        return outcome::success();
    }

    auto const &sender = account(command.at("sender"));
    if (op == "deposit") {
        BOOST_OUTCOME_TRY(
            auto const credited,
            contract_->deposit(sender, command.at("amount").get<uint256_t>()));
        LOG_INFO("deposit credited {}", credited);
    }
    else if (op == "announce") {
        BOOST_OUTCOME_TRY(contract_->announce(
            sender, command.at("amount").get<uint256_t>()));
        auto const &campaign = contract_->campaign();
        LOG_INFO(
            "campaign {} to {} paying {}",
            campaign.start_time,
            campaign.finish_time,
            campaign.reward_amount);
    }
    else if (op == "deposit_and_announce") {
        BOOST_OUTCOME_TRY(contract_->deposit_and_announce(
            sender, command.at("amount").get<uint256_t>()));
    }
    else if (op == "stake") {
        BOOST_OUTCOME_TRY(
            auto const credited,
            contract_->stake(sender, command.at("amount").get<uint256_t>()));
        LOG_INFO("{} staked {}", sender, credited);
    }
    else if (op == "unstake") {
        BOOST_OUTCOME_TRY(contract_->unstake(
            sender, command.at("amount").get<uint256_t>()));
    }
    else if (op == "claim") {
        BOOST_OUTCOME_TRY(auto const paid, contract_->claim_rewards(sender));
        LOG_INFO("{} claimed {}", sender, paid);
    }
    else if (op == "withdraw") {
        BOOST_OUTCOME_TRY(contract_->withdraw(
            sender,
            token(command.at("token")),
            command.at("amount").get<uint256_t>()));
    }
    else if (op == "set_campaign_duration") {
        BOOST_OUTCOME_TRY(contract_->set_campaign_duration(
            sender, command.at("seconds").get<uint64_t>()));
    }
    else if (op == "set_unstake_period") {
        BOOST_OUTCOME_TRY(contract_->set_unstake_period(
            sender, command.at("seconds").get<uint64_t>()));
    }
    else {
        BOBE_THROW(false, "unknown command");
    }
    return outcome::success();
}

void Replay::print_user(Address const &user) const
{
    auto const stats = contract_->get_user_stats(user);
    if (stats.has_error()) {
        LOG_ERROR(
            "user stats of {} failed: {}",
            user,
            stats.error().message().c_str());
        return;
    }
    auto const &s = stats.value();
    LOG_INFO(
        "user {}: stake={} pending={} claimed={} unlocked={} unstaked={} "
        "balance={}",
        user,
        s.current_stake,
        s.pending_rewards,
        s.total_claimed,
        s.unlocked_amount,
        s.total_unstaked,
        s.token_balance);
}

void Replay::print_global() const
{
    auto const stats = contract_->get_global_stats();
    if (stats.has_error()) {
        LOG_ERROR(
            "global stats failed: {}", stats.error().message().c_str());
        return;
    }
    auto const &s = stats.value();
    LOG_INFO(
        "global: staked={} stakers={} active={} distributed={} bank={} "
        "campaign={} [{}, {}]",
        s.total_staked,
        s.total_stakers,
        s.active_stakers,
        s.total_distributed,
        s.available_bank,
        s.current_campaign_rewards,
        s.campaign_start,
        s.campaign_end);
}

size_t Replay::run(bool const stop_on_error)
{
    size_t failures = 0;
    size_t index = 0;
    for (auto const &command : commands_) {
        if (command.contains("time")) {
            auto const time = command.at("time").get<uint64_t>();
            BOBE_THROW(
                time >= clock_.now(), "command timestamps must not decrease");
            clock_.set(time);
        }
        auto const op = command.at("op").get<std::string>();
        auto const res = execute(command);
        if (res.has_error()) {
            ++failures;
            LOG_ERROR(
                "#{} {} at {} failed: {}",
                index,
                op,
                clock_.now(),
                res.error().message().c_str());
            if (stop_on_error) {
                break;
            }
        }
        else {
            LOG_DEBUG("#{} {} at {} ok", index, op, clock_.now());
        }
        ++index;
    }
    return failures;
}
