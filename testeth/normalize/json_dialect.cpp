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

#include <testeth/normalize/dialect_parser.hpp>

#include <testeth/core/config.hpp>
#include <testeth/exec/raw_outcome.hpp>
#include <testeth/normalize/execution_result.hpp>
#include <testeth/state/from_json.hpp>
#include <testeth/state/state_json.hpp>
#include <testeth/vector/test_case.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

TESTETH_NAMESPACE_BEGIN

std::vector<std::string> JsonDialect::per_test_args(TestCase const &) const
{
    return {};
}

// {"post": {...}, "gasUsed": "0x5208", "logs": [...]}
void JsonDialect::parse(RawOutcome const &raw, ExecutionResult &result) const
{
    auto const j = nlohmann::json::parse(raw.stdout_text);

    result.post_state = state_from_json(require_field(j, "post", "output"), "post");
    if (auto const it = j.find("gasUsed"); it != j.end()) {
        result.resource_used = integer_from_json(*it);
    }
    // this dialect can always print logs, so an absent key means none
    result.logs = std::vector<LogEntry>{};
    if (auto const it = j.find("logs"); it != j.end()) {
        result.logs = logs_from_json(*it);
    }
}

TESTETH_NAMESPACE_END
