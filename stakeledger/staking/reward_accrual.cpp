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

#include <stakeledger/core/assert.h>
#include <stakeledger/core/int.hpp>
#include <stakeledger/core/likely.h>
#include <stakeledger/staking/reward_accrual.hpp>
#include <stakeledger/staking/user_stake.hpp>

#include <intx/intx.hpp>

#include <cstdint>

STAKELEDGER_NAMESPACE_BEGIN

uint256_t earned(
    UserStake const &stake, uint64_t const block_number,
    uint64_t const payout_gap) noexcept
{
    STAKELEDGER_ASSERT(payout_gap != 0);

    if (!stake.active) {
        return 0;
    }

    uint64_t const start_block = stake.stake_start_block.native();
    if (STAKELEDGER_UNLIKELY(block_number < start_block)) {
        return 0;
    }

    uint64_t const block_diff = block_number - start_block;
    if (block_diff <= payout_gap) {
        return 0;
    }
    return block_diff / payout_gap;
}

uint256_t claimable(
    UserStake const &stake, uint64_t const block_number,
    uint64_t const payout_gap) noexcept
{
    auto const reward = earned(stake, block_number, payout_gap);
    if (reward == 0) {
        return 0;
    }
    auto const delta = intx::subc(reward, stake.claimed.native());
    if (STAKELEDGER_UNLIKELY(delta.carry)) {
        return 0;
    }
    return delta.value;
}

STAKELEDGER_NAMESPACE_END
