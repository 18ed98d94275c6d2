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

#include <stakeledger/core/address.hpp>
#include <stakeledger/core/assert.h>
#include <stakeledger/core/bytes.hpp>
#include <stakeledger/state/log.hpp>
#include <stakeledger/state/state.hpp>

#include <cstddef>
#include <iterator>
#include <utility>

STAKELEDGER_NAMESPACE_BEGIN

bytes32_t
State::get_storage(Address const &address, bytes32_t const &key) const
{
    auto const account = storage_.find(address);
    if (account == storage_.end()) {
        return {};
    }
    auto const slot = account->second.find(key);
    if (slot == account->second.end()) {
        return {};
    }
    return slot->second;
}

void State::set_storage(
    Address const &address, bytes32_t const &key, bytes32_t const &value)
{
    auto const original = get_storage(address, key);
    if (original == value) {
        return;
    }
    if (!frames_.empty()) {
        frames_.back().journal.push_back(
            JournalEntry{.address = address, .key = key, .original = original});
    }
    write_(address, key, value);
}

void State::write_(
    Address const &address, bytes32_t const &key, bytes32_t const &value)
{
    if (value == bytes32_t{}) {
        auto account = storage_.find(address);
        if (account == storage_.end()) {
            return;
        }
        account->second.erase(key);
        if (account->second.empty()) {
            storage_.erase(account);
        }
    }
    else {
        storage_[address][key] = value;
    }
}

size_t State::storage_size(Address const &address) const
{
    auto const account = storage_.find(address);
    return account == storage_.end() ? 0 : account->second.size();
}

void State::store_log(Log const &log)
{
    logs_.push_back(log);
}

std::vector<Log> const &State::logs() const noexcept
{
    return logs_;
}

void State::push()
{
    frames_.push_back(Frame{.journal = {}, .log_count = logs_.size()});
}

void State::pop_accept()
{
    STAKELEDGER_ASSERT(!frames_.empty());
    auto frame = std::move(frames_.back());
    frames_.pop_back();
    if (!frames_.empty()) {
        auto &parent = frames_.back().journal;
        parent.insert(
            parent.end(),
            std::make_move_iterator(frame.journal.begin()),
            std::make_move_iterator(frame.journal.end()));
    }
}

void State::pop_reject()
{
    STAKELEDGER_ASSERT(!frames_.empty());
    auto frame = std::move(frames_.back());
    frames_.pop_back();

    // undo is not journaled: after it the state matches the matching push(),
    // which is what the enclosing frame's journal is relative to
    for (auto it = frame.journal.rbegin(); it != frame.journal.rend(); ++it) {
        write_(it->address, it->key, it->original);
    }
    STAKELEDGER_ASSERT(frame.log_count <= logs_.size());
    logs_.resize(frame.log_count);
}

size_t State::depth() const noexcept
{
    return frames_.size();
}

Checkpoint::Checkpoint(State &state)
    : state_{state}
{
    state_.push();
}

Checkpoint::~Checkpoint()
{
    if (!committed_) {
        state_.pop_reject();
    }
}

void Checkpoint::commit()
{
    STAKELEDGER_ASSERT(!committed_);
    state_.pop_accept();
    committed_ = true;
}

STAKELEDGER_NAMESPACE_END
