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
#include <bobe/core/int.hpp>
#include <bobe/core/result.hpp>
#include <bobe/staking/staking_contract.hpp>

#include <ankerl/unordered_dense.h>
#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

// Replays an append-only command log against a single staking contract.
//
// Scenario layout:
//   start_time     unix seconds the clock starts at
//   accounts       name -> hex address
//   admin          account name, granted the admin role
//   announcer      account name, granted the announcer role (optional)
//   staking_token  {address, name, symbol, decimals}
//   reward_token   {address, name, symbol, decimals}
//   mints          [{token: staking|reward, to, amount}], every holder
//                  approves the contract for its full balance
//   commands       [{op, time?, sender?, amount?, ...}]
class Replay
{
    bobe::ManualClock clock_;
    std::unique_ptr<bobe::Token> staking_token_;
    std::unique_ptr<bobe::Token> reward_token_;
    std::unique_ptr<bobe::staking::StakingContract> contract_;
    ankerl::unordered_dense::map<std::string, bobe::Address> accounts_;
    nlohmann::json commands_;

    bobe::Address const &account(nlohmann::json const &) const;
    bobe::Token &token(nlohmann::json const &);

    bobe::Result<void> execute(nlohmann::json const &command);
    void print_user(bobe::Address const &) const;
    void print_global() const;

public:
    explicit Replay(nlohmann::json const &scenario);

    Replay(Replay const &) = delete;
    Replay &operator=(Replay const &) = delete;

    // returns the number of failed commands
    size_t run(bool stop_on_error);

    bobe::staking::StakingContract const &contract() const noexcept
    {
        return *contract_;
    }

    bobe::Token const &staking_token() const noexcept
    {
        return *staking_token_;
    }

    bobe::Token const &reward_token() const noexcept
    {
        return *reward_token_;
    }

    uint64_t now() const
    {
        return clock_.now();
    }
};
