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
#include <stakeledger/core/int.hpp>
#include <stakeledger/staking/user_stake.hpp>

#include <cstdint>

STAKELEDGER_NAMESPACE_BEGIN

// Reward earned by a stake at block_number: one unit for every full
// payout_gap elapsed since the stake opened, and nothing until strictly more
// than payout_gap blocks have passed. Inactive stakes earn nothing.
uint256_t earned(
    UserStake const &, uint64_t block_number, uint64_t payout_gap) noexcept;

// earned() minus what was already moved to the withdrawal pool, floored at 0
uint256_t claimable(
    UserStake const &, uint64_t block_number, uint64_t payout_gap) noexcept;

STAKELEDGER_NAMESPACE_END
