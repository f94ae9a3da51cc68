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
#include <testeth/core/result.hpp>
#include <testeth/registry/tool_entry.hpp>

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

TESTETH_NAMESPACE_BEGIN

/// Named VM tools in registration order. Constructed by the caller and passed
/// by reference; must not be modified while a run is executing.
class ToolRegistry
{
    std::vector<ToolEntry> entries_{};

public:
    /// Re-registering a name replaces the entry in place (last write wins)
    Result<void> register_tool(
        std::string name, std::filesystem::path path,
        std::vector<std::string> args, Dialect = Dialect::Json);

    Result<void> unregister_tool(std::string_view name);

    Result<ToolEntry> lookup(std::string_view name) const;

    std::vector<ToolEntry> const &list() const noexcept
    {
        return entries_;
    }

    size_t size() const noexcept
    {
        return entries_.size();
    }

    bool empty() const noexcept
    {
        return entries_.empty();
    }
};

/// True if `path` names a regular file the current user may execute
bool is_executable_file(std::filesystem::path const &);

TESTETH_NAMESPACE_END
