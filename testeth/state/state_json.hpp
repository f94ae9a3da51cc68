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
#include <testeth/state/account.hpp>

#include <nlohmann/json_fwd.hpp>

#include <string_view>
#include <vector>

TESTETH_NAMESPACE_BEGIN

/// Parses `{"balance", "nonce", "code"?, "storage"?}`; throws
/// std::invalid_argument naming the offending field
Account account_from_json(nlohmann::json const &);

/// Parses an object keyed by account address
State state_from_json(nlohmann::json const &, std::string_view what);

/// Parses an array of `{"address", "topics", "data"}`
std::vector<LogEntry> logs_from_json(nlohmann::json const &);

/// Fetches a required member, throwing std::invalid_argument when absent
nlohmann::json const &
require_field(nlohmann::json const &, char const *key, std::string_view what);

TESTETH_NAMESPACE_END
