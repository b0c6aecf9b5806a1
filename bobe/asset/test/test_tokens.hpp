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

#include <bobe/asset/asset_error.hpp>
#include <bobe/asset/token.hpp>
#include <bobe/contract/checked_math.hpp>
#include <bobe/core/address.hpp>
#include <bobe/core/config.hpp>
#include <bobe/core/int.hpp>
#include <bobe/core/result.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <functional>
#include <optional>
#include <string>
#include <utility>

BOBE_NAMESPACE_BEGIN

namespace test
{
    // Burns fee_bps / 10000 of every transfer on the way to the recipient
    class FeeOnTransferToken : public Token
    {
        uint256_t fee_bps_;

    protected:
        Result<void> move_balance(
            Address const &from, Address const &to,
            uint256_t const &amount) override
        {
            if (to == Address{}) {
                return AssetError::InvalidRecipient;
            }
            BOOST_OUTCOME_TRY(debit(from, amount));
            credit(to, amount - amount * fee_bps_ / 10'000);
            return outcome::success();
        }

    public:
        FeeOnTransferToken(
            Address const &address, std::string name, std::string symbol,
            uint256_t const &fee_bps = 100)
            : Token{address, std::move(name), std::move(symbol)}
            , fee_bps_{fee_bps}
        {
        }
    };

    // Runs a callback before every balance move, the way a token with
    // transfer hooks hands control to third party code
    class ReentrantToken : public Token
    {
    protected:
        Result<void> move_balance(
            Address const &from, Address const &to,
            uint256_t const &amount) override
        {
            if (hook) {
                hook();
            }
            return Token::move_balance(from, to, amount);
        }

    public:
        using Token::Token;

        std::function<void()> hook;
    };

    // Refuses transfers out of one address while armed
    class FailingToken : public Token
    {
    protected:
        Result<void> move_balance(
            Address const &from, Address const &to,
            uint256_t const &amount) override
        {
            if (blocked_sender.has_value() && *blocked_sender == from) {
                return AssetError::InsufficientBalance;
            }
            return Token::move_balance(from, to, amount);
        }

    public:
        using Token::Token;

        std::optional<Address> blocked_sender;
    };
}

BOBE_NAMESPACE_END
