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

#include <stakeledger/staking/stake_error.hpp>

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

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<stakeledger::StakeError>::mapping> const &
quick_status_code_from_enum<stakeledger::StakeError>::value_mappings()
{
    using stakeledger::StakeError;

    static std::initializer_list<mapping> const v = {
        {StakeError::Success, "success", {errc::success}},
        {StakeError::Unauthorized,
         "caller lacks required role",
         {errc::permission_denied}},
        {StakeError::InvalidAmount,
         "amount is zero or below minimum stake",
         {errc::invalid_argument}},
        {StakeError::AlreadyStaked, "account already has an active stake", {}},
        {StakeError::NoActiveStake, "account has no active stake", {}},
        {StakeError::NothingToClaim, "nothing to claim", {}},
        {StakeError::EmptyWithdrawPool, "withdrawal pool is empty", {}},
        {StakeError::TransferFailed, "token transfer failed", {}},
        {StakeError::ReentrantCall,
         "reentrant call",
         {errc::resource_unavailable_try_again}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
