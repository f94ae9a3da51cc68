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

#include <testeth/registry/tool_registry.hpp>

#include <testeth/core/config.hpp>
#include <testeth/core/result.hpp>
#include <testeth/registry/registry_error.hpp>
#include <testeth/registry/tool_entry.hpp>

#include <quill/Quill.h>

#include <algorithm>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <unistd.h>

TESTETH_NAMESPACE_BEGIN

std::string_view to_string(Dialect const dialect)
{
    switch (dialect) {
    case Dialect::Json:
        return "json";
    case Dialect::Geth:
        return "geth";
    }
    return "unknown";
}

bool is_executable_file(std::filesystem::path const &path)
{
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return false;
    }
    return ::access(path.c_str(), X_OK) == 0;
}

Result<void> ToolRegistry::register_tool(
    std::string name, std::filesystem::path path,
    std::vector<std::string> args, Dialect const dialect)
{
    if (name.empty()) {
        return RegistryError::InvalidName;
    }
    if (!is_executable_file(path)) {
        LOG_WARNING(
            "refusing to register {}: {} is not an executable file",
            name,
            path.string());
        return RegistryError::InvalidExecutable;
    }

    ToolEntry entry{
        .name = std::move(name),
        .path = std::move(path),
        .args = std::move(args),
        .dialect = dialect};
    auto const it = std::ranges::find(entries_, entry.name, &ToolEntry::name);
    if (it != entries_.end()) {
        *it = std::move(entry);
    }
    else {
        entries_.push_back(std::move(entry));
    }
    return outcome::success();
}

Result<void> ToolRegistry::unregister_tool(std::string_view const name)
{
    auto const it = std::ranges::find(entries_, name, &ToolEntry::name);
    if (it == entries_.end()) {
        return RegistryError::NotFound;
    }
    entries_.erase(it);
    return outcome::success();
}

Result<ToolEntry> ToolRegistry::lookup(std::string_view const name) const
{
    auto const it = std::ranges::find(entries_, name, &ToolEntry::name);
    if (it == entries_.end()) {
        return RegistryError::NotFound;
    }
    return *it;
}

TESTETH_NAMESPACE_END
