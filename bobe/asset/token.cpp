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

#include <bobe/asset/asset_error.hpp>
#include <bobe/asset/token.hpp>
#include <bobe/contract/checked_math.hpp>
#include <bobe/contract/events.hpp>
#include <bobe/core/likely.h>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <utility>

BOBE_NAMESPACE_BEGIN

Token::Token(
    Address const &address, std::string name, std::string symbol,
    uint8_t const decimals)
    : address_{address}
    , name_{std::move(name)}
    , symbol_{std::move(symbol)}
    , decimals_{decimals}
{
}

Address const &Token::address() const noexcept
{
    return address_;
}

uint8_t Token::decimals() const noexcept
{
    return decimals_;
}

uint256_t Token::balance_of(Address const &owner) const
{
    auto const it = balances_.find(owner);
    return it == balances_.end() ? uint256_t{0} : it->second;
}

uint256_t Token::allowance(Address const &owner, Address const &spender) const
{
    auto const it = allowances_.find(owner);
    if (it == allowances_.end()) {
        return 0;
    }
    auto const jt = it->second.find(spender);
    return jt == it->second.end() ? uint256_t{0} : jt->second;
}

void Token::approve(
    Address const &owner, Address const &spender, uint256_t const &amount)
{
    allowances_[owner][spender] = amount;
    emit_log(EventBuilder(address_, "Approval")
                 .add_topic(owner)
                 .add_topic(spender)
                 .add_data(amount)
                 .build());
}

Result<void> Token::mint(Address const &to, uint256_t const &amount)
{
    if (BOBE_UNLIKELY(to == Address{})) {
        return AssetError::InvalidRecipient;
    }
    BOOST_OUTCOME_TRY(auto const supply, checked_add(total_supply_, amount));
    total_supply_ = supply;
    credit(to, amount);
    emit_log(EventBuilder(address_, "Transfer")
                 .add_topic(Address{})
                 .add_topic(to)
                 .add_data(amount)
                 .build());
    return outcome::success();
}

Result<void> Token::burn(Address const &from, uint256_t const &amount)
{
    BOOST_OUTCOME_TRY(debit(from, amount));
    total_supply_ -= amount;
    emit_log(EventBuilder(address_, "Transfer")
                 .add_topic(from)
                 .add_topic(Address{})
                 .add_data(amount)
                 .build());
    return outcome::success();
}

Result<void> Token::transfer(
    Address const &sender, Address const &to, uint256_t const &amount)
{
    return move_balance(sender, to, amount);
}

Result<void> Token::transfer_from(
    Address const &spender, Address const &from, Address const &to,
    uint256_t const &amount)
{
    auto const allowed = allowance(from, spender);
    if (BOBE_UNLIKELY(allowed < amount)) {
        return AssetError::InsufficientAllowance;
    }
    BOOST_OUTCOME_TRY(move_balance(from, to, amount));
    if (allowed != UINT256_MAX) {
        allowances_[from][spender] = allowed - amount;
    }
    return outcome::success();
}

Result<void> Token::move_balance(
    Address const &from, Address const &to, uint256_t const &amount)
{
    if (BOBE_UNLIKELY(to == Address{})) {
        return AssetError::InvalidRecipient;
    }
    BOOST_OUTCOME_TRY(debit(from, amount));
    credit(to, amount);
    emit_log(EventBuilder(address_, "Transfer")
                 .add_topic(from)
                 .add_topic(to)
                 .add_data(amount)
                 .build());
    return outcome::success();
}

Result<void> Token::debit(Address const &from, uint256_t const &amount)
{
    auto const it = balances_.find(from);
    if (BOBE_UNLIKELY(it == balances_.end() || it->second < amount)) {
        return AssetError::InsufficientBalance;
    }
    it->second -= amount;
    return outcome::success();
}

void Token::credit(Address const &to, uint256_t const &amount)
{
    // cannot overflow: every balance is bounded by the total supply
    balances_[to] += amount;
}

void Token::emit_log(Log &&log)
{
    logs_.push_back(std::move(log));
}

BOBE_NAMESPACE_END
