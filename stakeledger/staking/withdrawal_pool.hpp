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
#include <stakeledger/state/big_endian.hpp>
#include <stakeledger/state/storage_variable.hpp>

STAKELEDGER_NAMESPACE_BEGIN

class State;
class TokenGateway;

// Amounts owed to accounts, settled by claim and unstake and paid out by
// withdraw. Independent of stake state: an account may have a balance here
// with no active stake.
class WithdrawalPool
{
    State &state_;
    Address const &ca_;

    static constexpr auto AddressTotalPending{
        0x0000000000000000000000000000000000000000000000000000000000000004_bytes32};

    // mapping (address => uint256) pending
    StorageVariable<u256_be> balance_of(Address const &) const noexcept;
    StorageVariable<u256_be> total() const noexcept;

    /////////////
    // Events //
    /////////////

    // event Withdraw(
    //     address indexed account,
    //     uint256         amount);
    void emit_withdraw_event(Address const &, uint256_t const &);

public:
    WithdrawalPool(State &, Address const &);

    uint256_t pending(Address const &) const;
    uint256_t total_pending() const;

    // amount must be non-zero
    void credit(Address const &, uint256_t const &amount);

    // Zeroes the account's balance and pays it out through the gateway. The
    // balance is cleared before the gateway is called, and the whole
    // operation is rolled back if the payout fails.
    Result<uint256_t> withdraw(Address const &, TokenGateway &);
};

STAKELEDGER_NAMESPACE_END
