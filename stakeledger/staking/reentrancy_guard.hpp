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

#include <stakeledger/core/assert.h>
#include <stakeledger/core/config.hpp>

STAKELEDGER_NAMESPACE_BEGIN

// Holds a ledger's entered flag for the lifetime of a mutating call.
class ReentrancyGuard
{
    bool &entered_;

public:
    explicit ReentrancyGuard(bool &entered)
        : entered_{entered}
    {
        STAKELEDGER_ASSERT(!entered_);
        entered_ = true;
    }

    ReentrancyGuard(ReentrancyGuard const &) = delete;
    ReentrancyGuard &operator=(ReentrancyGuard const &) = delete;

    ~ReentrancyGuard()
    {
        entered_ = false;
    }
};

STAKELEDGER_NAMESPACE_END
