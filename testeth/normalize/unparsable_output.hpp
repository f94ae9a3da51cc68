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

#include <testeth/core/config.hpp>

#include <stdexcept>
#include <string>

TESTETH_NAMESPACE_BEGIN

/// Thrown when a dialect cannot extract a well formed post state
class UnparsableOutput : public std::runtime_error
{
    std::string tool_name_;
    std::string raw_;

public:
    UnparsableOutput(
        std::string tool_name, std::string const &reason, std::string raw);

    std::string const &tool_name() const noexcept
    {
        return tool_name_;
    }

    std::string const &raw() const noexcept
    {
        return raw_;
    }
};

TESTETH_NAMESPACE_END
