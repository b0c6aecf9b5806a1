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

#include <bobe/core/config.hpp>

#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <initializer_list>

BOBE_NAMESPACE_BEGIN

enum class SwapError
{
    Success = 0,
    Unauthorized,
    AlreadyInitialized,
    NotInitialized,
    MainTokenAlreadySet,
    MainTokenNotSet,
    PriceFeedNotSet,
    InvalidAddress,
    InvalidAmount,
    InvalidDuration,
    UnsupportedAsset,
    InvalidPrice,
    StalePrice,
    InsufficientLiquidity,
    TransferFailed,
    Reentrancy,
};

BOBE_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<bobe::SwapError>
    : quick_status_code_from_enum_defaults<bobe::SwapError>
{
    static constexpr auto const domain_name = "Swap Error";
    static constexpr auto const domain_uuid =
        "5c8e1f40-2b7d-4a93-9e16-d03a7b4c2f58";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
