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
#include <stakeledger/core/bytes.hpp>
#include <stakeledger/core/config.hpp>
#include <stakeledger/state/log.hpp>

#include <utility>

STAKELEDGER_NAMESPACE_BEGIN

// Simple API for building events in a solidity compatible manner. Data should
// be encoded using the abi helpers.
class EventBuilder
{
    Log event_;

public:
    explicit EventBuilder(Address const &account, bytes32_t const &signature)
    {
        event_.address = account;
        event_.topics.push_back(signature);
    }

    // Add an indexed parameter
    EventBuilder &add_topic(bytes32_t const &topic)
    {
        event_.topics.push_back(topic);
        return *this;
    }

    // Add a non-indexed parameter
    EventBuilder &add_data(bytes32_t const &word)
    {
        event_.data.append(word.bytes, sizeof(bytes32_t));
        return *this;
    }

    Log build()
    {
        return std::move(event_);
    }
};

STAKELEDGER_NAMESPACE_END
