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

#include <stakeledger/core/basic_formatter.hpp>
#include <stakeledger/core/int.hpp>

#include <quill/Quill.h>
#include <quill/bundled/fmt/format.h>

#include <intx/intx.hpp>

template <>
struct quill::copy_loggable<intx::uint256> : std::true_type
{
};

template <>
struct fmt::formatter<intx::uint256> : public stakeledger::BasicFormatter
{
    template <typename FormatContext>
    auto format(intx::uint256 const &value, FormatContext &ctx) const
    {
        fmt::format_to(ctx.out(), "{}", intx::to_string(value));
        return ctx.out();
    }
};
