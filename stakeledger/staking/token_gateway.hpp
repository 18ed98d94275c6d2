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

#include <stakeledger/core/address.hpp>
#include <stakeledger/core/config.hpp>
#include <stakeledger/core/int.hpp>
#include <stakeledger/core/result.hpp>

STAKELEDGER_NAMESPACE_BEGIN

// Custody of the staked asset. The ledger calls deposit() when a stake is
// opened and payout() when a withdrawal is settled, and nowhere else. A failed
// call must leave no side effect behind.
class TokenGateway
{
public:
    virtual ~TokenGateway() = default;

    virtual Result<void>
    deposit(Address const &from, uint256_t const &amount) = 0;

    virtual Result<void>
    payout(Address const &to, uint256_t const &amount) = 0;
};

STAKELEDGER_NAMESPACE_END
