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

#include <testeth/state/state_json.hpp>

#include <testeth/core/basic_formatter.hpp>
#include <testeth/core/bytes.hpp>
#include <testeth/core/config.hpp>
#include <testeth/state/account.hpp>
#include <testeth/state/from_json.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

TESTETH_NAMESPACE_BEGIN

nlohmann::json const &require_field(
    nlohmann::json const &j, char const *const key, std::string_view const what)
{
    if (!j.is_object()) {
        throw std::invalid_argument{fmt::format(
            "{} must be an object, found {}", what, j.type_name())};
    }
    auto const it = j.find(key);
    if (it == j.end()) {
        throw std::invalid_argument{
            fmt::format("missing required field '{}' in {}", key, what)};
    }
    return *it;
}

Account account_from_json(nlohmann::json const &j)
{
    Account account;
    account.balance =
        require_field(j, "balance", "account").get<uint256_t>();
    account.nonce = integer_from_json(require_field(j, "nonce", "account"));
    if (auto const it = j.find("code"); it != j.end()) {
        account.code = it->get<byte_string>();
    }
    if (auto const it = j.find("storage"); it != j.end()) {
        if (!it->is_object()) {
            throw std::invalid_argument{"account storage must be an object"};
        }
        for (auto const &[key, value] : it->items()) {
            nlohmann::json const key_json = key;
            auto const slot = key_json.get<bytes32_t>();
            auto const word = value.get<bytes32_t>();
            if (word == bytes32_t{}) {
                continue;
            }
            account.storage[slot] = word;
        }
    }
    return account;
}

State state_from_json(nlohmann::json const &j, std::string_view const what)
{
    if (!j.is_object()) {
        throw std::invalid_argument{fmt::format(
            "{} must be an object keyed by address, found {}",
            what,
            j.type_name())};
    }
    State state;
    for (auto const &[j_addr, j_acc] : j.items()) {
        nlohmann::json const addr_json = j_addr;
        auto const address = addr_json.get<Address>();
        try {
            state[address] = account_from_json(j_acc);
        }
        catch (std::exception const &e) {
            throw std::invalid_argument{
                fmt::format("{} account {}: {}", what, j_addr, e.what())};
        }
    }
    return state;
}

std::vector<LogEntry> logs_from_json(nlohmann::json const &j)
{
    if (!j.is_array()) {
        throw std::invalid_argument{"logs must be an array"};
    }
    std::vector<LogEntry> logs;
    logs.reserve(j.size());
    for (auto const &j_log : j) {
        LogEntry entry;
        entry.address = require_field(j_log, "address", "log").get<Address>();
        if (auto const it = j_log.find("topics"); it != j_log.end()) {
            for (auto const &topic : *it) {
                entry.topics.push_back(topic.get<bytes32_t>());
            }
        }
        if (auto const it = j_log.find("data"); it != j_log.end()) {
            entry.data = it->get<byte_string>();
        }
        logs.push_back(std::move(entry));
    }
    return logs;
}

bool operator<(LogEntry const &a, LogEntry const &b)
{
    if (a.address != b.address) {
        return a.address < b.address;
    }
    if (a.topics != b.topics) {
        return std::lexicographical_compare(
            a.topics.begin(), a.topics.end(), b.topics.begin(), b.topics.end());
    }
    return a.data < b.data;
}

TESTETH_NAMESPACE_END
