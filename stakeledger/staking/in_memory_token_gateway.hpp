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
#include <stakeledger/staking/token_gateway.hpp>

#include <ankerl/unordered_dense.h>

STAKELEDGER_NAMESPACE_BEGIN

// Single-asset token ledger. Deposits move funds from a wallet into the
// custody account and payouts move them back out.
class InMemoryTokenGateway final : public TokenGateway
{
    Address custody_;
    ankerl::unordered_dense::map<Address, uint256_t> balances_{};

    Result<void> transfer(
        Address const &from, Address const &to, uint256_t const &amount);

public:
    explicit InMemoryTokenGateway(Address const &custody);

    Address const &custody() const noexcept
    {
        return custody_;
    }

    void mint(Address const &, uint256_t const &);
    uint256_t balance_of(Address const &) const;

    Result<void>
    deposit(Address const &from, uint256_t const &amount) override;
    Result<void> payout(Address const &to, uint256_t const &amount) override;
};

STAKELEDGER_NAMESPACE_END
