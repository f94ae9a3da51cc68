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

#include <testeth/normalize/output_normalizer.hpp>

#include <testeth/core/assert.h>
#include <testeth/core/basic_formatter.hpp>
#include <testeth/core/config.hpp>
#include <testeth/exec/raw_outcome.hpp>
#include <testeth/normalize/dialect_parser.hpp>
#include <testeth/normalize/execution_result.hpp>
#include <testeth/normalize/unparsable_output.hpp>
#include <testeth/registry/tool_entry.hpp>
#include <testeth/vector/test_case.hpp>

#include <quill/Quill.h>

#include <cstddef>
#include <exception>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

TESTETH_NAMESPACE_BEGIN

UnparsableOutput::UnparsableOutput(
    std::string tool_name, std::string const &reason, std::string raw)
    : std::runtime_error{reason}
    , tool_name_{std::move(tool_name)}
    , raw_{std::move(raw)}
{
}

OutputNormalizer::OutputNormalizer()
{
    parsers_.emplace(Dialect::Json, std::make_unique<JsonDialect const>());
    parsers_.emplace(Dialect::Geth, std::make_unique<GethDialect const>());
}

DialectParser const &OutputNormalizer::parser(Dialect const dialect) const
{
    auto const it = parsers_.find(dialect);
    TESTETH_ASSERT(it != parsers_.end(), "dialect without a parser");
    return *it->second;
}

std::vector<std::string> OutputNormalizer::per_test_args(
    ToolEntry const &tool, TestCase const &test) const
{
    return parser(tool.dialect).per_test_args(test);
}

ExecutionResult
OutputNormalizer::normalize(ToolEntry const &tool, RawOutcome const &raw) const
{
    ExecutionResult result;
    try {
        parser(tool.dialect).parse(raw, result);
    }
    catch (std::exception const &e) {
        // invalid_argument from our parsing, json::exception from nlohmann
        constexpr size_t excerpt = 256;
        LOG_WARNING(
            "{} produced unparsable {} output: {}; stdout starts with: {}",
            tool.name,
            std::string{to_string(tool.dialect)},
            e.what(),
            raw.stdout_text.substr(0, excerpt));
        throw UnparsableOutput{tool.name, e.what(), raw.stdout_text};
    }
    result.raw_duration = raw.duration;
    result.exit_code = raw.exit_code;
    result.stderr_text = raw.stderr_text;
    return result;
}

TESTETH_NAMESPACE_END
