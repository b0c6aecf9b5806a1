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

#include <bobe/swap/swap_error.hpp>

#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/generic_code.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/generic_code.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <initializer_list>

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<bobe::SwapError>::mapping> const &
quick_status_code_from_enum<bobe::SwapError>::value_mappings()
{
    using bobe::SwapError;

    static std::initializer_list<mapping> const v = {
        {SwapError::Success, "success", {errc::success}},
        {SwapError::Unauthorized, "caller is not an admin", {}},
        {SwapError::AlreadyInitialized, "already initialized", {}},
        {SwapError::NotInitialized, "not initialized", {}},
        {SwapError::MainTokenAlreadySet, "main token already set", {}},
        {SwapError::MainTokenNotSet, "main token not set", {}},
        {SwapError::PriceFeedNotSet, "price feed not set", {}},
        {SwapError::InvalidAddress, "invalid address", {}},
        {SwapError::InvalidAmount, "amount must be greater than zero", {}},
        {SwapError::InvalidDuration, "duration must be greater than zero", {}},
        {SwapError::UnsupportedAsset, "token not allowed", {}},
        {SwapError::InvalidPrice, "invalid price", {}},
        {SwapError::StalePrice, "price data is stale", {}},
        {SwapError::InsufficientLiquidity,
         "not enough main tokens in contract",
         {}},
        {SwapError::TransferFailed, "transfer failed", {}},
        {SwapError::Reentrancy, "reentrant call", {}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
