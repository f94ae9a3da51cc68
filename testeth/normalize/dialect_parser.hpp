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
#include <testeth/normalize/execution_result.hpp>
#include <testeth/vector/test_case.hpp>

#include <string>
#include <vector>

TESTETH_NAMESPACE_BEGIN

/// Knows how one family of tools is invoked and how it prints its result
class DialectParser
{
public:
    virtual ~DialectParser() = default;

    /// Appended after the tool's fixed arguments
    virtual std::vector<std::string> per_test_args(TestCase const &) const = 0;

    /// Fills the dialect specific fields of the result; throws
    /// std::invalid_argument or nlohmann::json::exception on bad output
    virtual void parse(RawOutcome const &, ExecutionResult &) const = 0;
};

class JsonDialect final : public DialectParser
{
public:
    std::vector<std::string> per_test_args(TestCase const &) const override;
    void parse(RawOutcome const &, ExecutionResult &) const override;
};

/// go-ethereum `evm` style: state dump on stdout, statistics as text
class GethDialect final : public DialectParser
{
public:
    std::vector<std::string> per_test_args(TestCase const &) const override;
    void parse(RawOutcome const &, ExecutionResult &) const override;
};

TESTETH_NAMESPACE_END
