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

#include <bobe/staking/config.hpp>

// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <cstdint>
#include <initializer_list>
#include <string_view>

BOBE_STAKING_NAMESPACE_BEGIN

enum class StakingError
{
    Success = 0,
    InvalidAmount,
    Unauthorized,
    TokensNotSet,
    SameToken,
    InvalidDuration,
    DurationTooLong,
    InvalidBatchSize,
    EmptyAddressList,
    OutOfBounds,
    UnknownAsset,
    NotInitialized,
    InsufficientUnlockedPrincipal,
    InsufficientDeposit,
    InsufficientTreasury,
    NoRewardsAvailable,
    CampaignActive,
    TokensAlreadySet,
    AlreadyInitialized,
    Reentrancy,
    TransferFailed,
};

enum class ErrorClass : uint8_t
{
    None = 0,
    PreconditionViolation,
    ResourceExhaustion,
    StateConflict,
    ExternalTransferFailure,
};

ErrorClass staking_error_class(StakingError);
std::string_view error_class_name(ErrorClass);

BOBE_STAKING_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<bobe::staking::StakingError>
    : quick_status_code_from_enum_defaults<bobe::staking::StakingError>
{
    static constexpr auto const domain_name = "Staking Error";
    static constexpr auto const domain_uuid =
        "7f6a2c1d-93b4-4e0a-8c5d-2b1e6f4a9d03";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
