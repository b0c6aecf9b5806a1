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

#include <bobe/asset/fungible_asset.hpp>
#include <bobe/contract/events.hpp>
#include <bobe/core/address.hpp>
#include <bobe/core/config.hpp>
#include <bobe/core/int.hpp>
#include <bobe/core/result.hpp>

#include <ankerl/unordered_dense.h>

#include <cstdint>
#include <string>
#include <vector>

BOBE_NAMESPACE_BEGIN

// In-memory ERC-20 style ledger
class Token : public FungibleAsset
{
    Address address_;
    std::string name_;
    std::string symbol_;
    uint8_t decimals_;
    uint256_t total_supply_{0};

    ankerl::unordered_dense::map<Address, uint256_t> balances_;
    ankerl::unordered_dense::map<
        Address, ankerl::unordered_dense::map<Address, uint256_t>>
        allowances_;

    std::vector<Log> logs_;

protected:
    // Moves value between two holders. Derived assets override this to
    // charge transfer fees or to call out to third parties.
    virtual Result<void> move_balance(
        Address const &from, Address const &to, uint256_t const &amount);

    Result<void> debit(Address const &from, uint256_t const &amount);
    void credit(Address const &to, uint256_t const &amount);
    void emit_log(Log &&);

public:
    Token(
        Address const &address, std::string name, std::string symbol,
        uint8_t decimals = 18);

    std::string const &name() const noexcept
    {
        return name_;
    }

    std::string const &symbol() const noexcept
    {
        return symbol_;
    }

    uint256_t const &total_supply() const noexcept
    {
        return total_supply_;
    }

    std::vector<Log> const &logs() const noexcept
    {
        return logs_;
    }

    uint256_t allowance(Address const &owner, Address const &spender) const;
    void approve(
        Address const &owner, Address const &spender, uint256_t const &amount);

    Result<void> mint(Address const &to, uint256_t const &amount);
    Result<void> burn(Address const &from, uint256_t const &amount);

    // FungibleAsset
    Address const &address() const noexcept override;
    uint8_t decimals() const noexcept override;
    uint256_t balance_of(Address const &owner) const override;
    Result<void> transfer(
        Address const &sender, Address const &to,
        uint256_t const &amount) override;
    Result<void> transfer_from(
        Address const &spender, Address const &from, Address const &to,
        uint256_t const &amount) override;
};

BOBE_NAMESPACE_END
