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
#include <testeth/exec/raw_outcome.hpp>
#include <testeth/normalize/dialect_parser.hpp>
#include <testeth/normalize/execution_result.hpp>
#include <testeth/normalize/unparsable_output.hpp>
#include <testeth/registry/tool_entry.hpp>
#include <testeth/vector/test_case.hpp>

#include <map>
#include <memory>
#include <string>
#include <vector>

TESTETH_NAMESPACE_BEGIN

/// Maps each dialect tag to its parser; the tag on the ToolEntry decides,
/// output content is never sniffed
class OutputNormalizer
{
    std::map<Dialect, std::unique_ptr<DialectParser const>> parsers_;

public:
    OutputNormalizer();

    DialectParser const &parser(Dialect) const;

    std::vector<std::string>
    per_test_args(ToolEntry const &, TestCase const &) const;

    /// @throws UnparsableOutput
    ExecutionResult normalize(ToolEntry const &, RawOutcome const &) const;
};

TESTETH_NAMESPACE_END
