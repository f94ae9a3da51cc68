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

#include <filesystem>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

TESTETH_NAMESPACE_BEGIN

/// Output format of a tool; selects the normalization strategy
enum class Dialect
{
    Json,
    Geth,
};

inline std::unordered_map<std::string, Dialect> const dialect_map = {
    {"json", Dialect::Json},
    {"geth", Dialect::Geth},
};

std::string_view to_string(Dialect);

struct ToolEntry
{
    std::string name;
    std::filesystem::path path;
    std::vector<std::string> args;
    Dialect dialect{Dialect::Json};

    friend bool operator==(ToolEntry const &, ToolEntry const &) = default;
};

TESTETH_NAMESPACE_END
