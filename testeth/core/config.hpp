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

#include <bit>
#include <climits>

#define TESTETH_NAMESPACE_BEGIN                                                \
    namespace testeth                                                          \
    {

#define TESTETH_NAMESPACE_END }

#define TESTETH_NAMESPACE ::testeth

#define TESTETH_ANONYMOUS_NAMESPACE_BEGIN                                      \
    TESTETH_NAMESPACE_BEGIN                                                    \
    namespace                                                                  \
    {

#define TESTETH_ANONYMOUS_NAMESPACE_END                                        \
    }                                                                          \
    TESTETH_NAMESPACE_END

static_assert(CHAR_BIT == 8);

static_assert(
    std::endian::native == std::endian::big ||
    std::endian::native == std::endian::little);
