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

#include <bobe/core/assert.h>
#include <bobe/staking/util/staking_error.hpp>

// TODO unstable paths between versions
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

BOBE_STAKING_NAMESPACE_BEGIN

ErrorClass staking_error_class(StakingError const e)
{
    switch (e) {
    case StakingError::Success:
        return ErrorClass::None;
    case StakingError::InvalidAmount:
    case StakingError::Unauthorized:
    case StakingError::TokensNotSet:
    case StakingError::SameToken:
    case StakingError::InvalidDuration:
    case StakingError::DurationTooLong:
    case StakingError::InvalidBatchSize:
    case StakingError::EmptyAddressList:
    case StakingError::OutOfBounds:
    case StakingError::UnknownAsset:
    case StakingError::NotInitialized:
        return ErrorClass::PreconditionViolation;
    case StakingError::InsufficientUnlockedPrincipal:
    case StakingError::InsufficientDeposit:
    case StakingError::InsufficientTreasury:
    case StakingError::NoRewardsAvailable:
        return ErrorClass::ResourceExhaustion;
    case StakingError::CampaignActive:
    case StakingError::TokensAlreadySet:
    case StakingError::AlreadyInitialized:
    case StakingError::Reentrancy:
        return ErrorClass::StateConflict;
    case StakingError::TransferFailed:
        return ErrorClass::ExternalTransferFailure;
    }
    BOBE_ABORT("unknown staking error");
}

std::string_view error_class_name(ErrorClass const c)
{
    switch (c) {
    case ErrorClass::None:
        return "none";
    case ErrorClass::PreconditionViolation:
        return "precondition violation";
    case ErrorClass::ResourceExhaustion:
        return "resource exhaustion";
    case ErrorClass::StateConflict:
        return "state conflict";
    case ErrorClass::ExternalTransferFailure:
        return "external transfer failure";
    }
    BOBE_ABORT("unknown error class");
}

BOBE_STAKING_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<bobe::staking::StakingError>::mapping> const &
quick_status_code_from_enum<bobe::staking::StakingError>::value_mappings()
{
    using bobe::staking::StakingError;

    static std::initializer_list<mapping> const v = {
        {StakingError::Success, "success", {errc::success}},
        {StakingError::InvalidAmount, "amount must be greater than zero", {}},
        {StakingError::Unauthorized, "caller lacks the required role", {}},
        {StakingError::TokensNotSet, "token addresses not set", {}},
        {StakingError::SameToken,
         "staking and reward tokens must differ",
         {}},
        {StakingError::InvalidDuration, "duration must be > 0", {}},
        {StakingError::DurationTooLong, "duration too long", {}},
        {StakingError::InvalidBatchSize,
         "batch size must be greater than 0",
         {}},
        {StakingError::EmptyAddressList, "addresses array cannot be empty", {}},
        {StakingError::OutOfBounds, "offset out of bounds", {}},
        {StakingError::UnknownAsset, "unknown asset", {}},
        {StakingError::NotInitialized, "contract not initialized", {}},
        {StakingError::InsufficientUnlockedPrincipal,
         "amount exceeds unlockable balance",
         {}},
        {StakingError::InsufficientDeposit, "not enough deposit", {}},
        {StakingError::InsufficientTreasury,
         "amount exceeds withdrawable balance",
         {}},
        {StakingError::NoRewardsAvailable, "no rewards", {}},
        {StakingError::CampaignActive,
         "the previous campaign hasn't finished",
         {}},
        {StakingError::TokensAlreadySet, "token addresses already set", {}},
        {StakingError::AlreadyInitialized, "already initialized", {}},
        {StakingError::Reentrancy, "reentrant call", {}},
        {StakingError::TransferFailed, "asset transfer failed", {}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
