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
#include <testeth/registry/tool_registry.hpp>

#include <filesystem>

TESTETH_NAMESPACE_BEGIN

inline constexpr char const *DEFAULT_REGISTRY_FILE = "testeth.json";

/// A missing file yields an empty registry. Entries whose executable no
/// longer exists are dropped with a warning.
Result<ToolRegistry> load_registry(std::filesystem::path const &);

/// Writes `<file>.tmp` and renames it over `<file>`
Result<void>
save_registry(ToolRegistry const &, std::filesystem::path const &);

TESTETH_NAMESPACE_END
