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

#include <stakeledger/core/likely.h>
#include <stakeledger/staking/in_memory_token_gateway.hpp>
#include <stakeledger/staking/token_error.hpp>

#include <boost/outcome/success_failure.hpp>

STAKELEDGER_NAMESPACE_BEGIN

InMemoryTokenGateway::InMemoryTokenGateway(Address const &custody)
    : custody_{custody}
{
}

void InMemoryTokenGateway::mint(Address const &account, uint256_t const &amount)
{
    balances_[account] += amount;
}

uint256_t InMemoryTokenGateway::balance_of(Address const &account) const
{
    auto const it = balances_.find(account);
    return it == balances_.end() ? uint256_t{0} : it->second;
}

Result<void> InMemoryTokenGateway::transfer(
    Address const &from, Address const &to, uint256_t const &amount)
{
    if (STAKELEDGER_UNLIKELY(amount == 0)) {
        return TokenError::InvalidAmount;
    }
    uint256_t const available = balance_of(from);
    if (STAKELEDGER_UNLIKELY(available < amount)) {
        return from == custody_ ? TokenError::InsufficientCustody
                                : TokenError::InsufficientBalance;
    }
    balances_[from] = available - amount;
    balances_[to] += amount;
    return outcome::success();
}

Result<void>
InMemoryTokenGateway::deposit(Address const &from, uint256_t const &amount)
{
    return transfer(from, custody_, amount);
}

Result<void>
InMemoryTokenGateway::payout(Address const &to, uint256_t const &amount)
{
    return transfer(custody_, to, amount);
}

STAKELEDGER_NAMESPACE_END
