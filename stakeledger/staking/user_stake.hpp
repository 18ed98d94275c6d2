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

#include <stakeledger/core/config.hpp>
#include <stakeledger/state/big_endian.hpp>
#include <stakeledger/state/storage_variable.hpp>

STAKELEDGER_NAMESPACE_BEGIN

// One record per account. An account that never staked, or that unstaked,
// reads back as the all-zero record, which is the inactive state.
struct UserStake
{
    u256_be stake_amount;
    u64_be stake_start_block;
    u256_be claimed;
    bool active;
};

static_assert(sizeof(UserStake) == 73);
static_assert(alignof(UserStake) == 1);
static_assert(StorageVariable<UserStake>::N == 3);

STAKELEDGER_NAMESPACE_END
