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

#include <testeth/registry/registry_file.hpp>

#include <testeth/core/config.hpp>
#include <testeth/core/result.hpp>
#include <testeth/registry/registry_error.hpp>
#include <testeth/registry/tool_entry.hpp>
#include <testeth/registry/tool_registry.hpp>

#include <nlohmann/json.hpp>

#include <quill/Quill.h>

#include <exception>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

TESTETH_NAMESPACE_BEGIN

Result<ToolRegistry> load_registry(std::filesystem::path const &file)
{
    ToolRegistry registry;

    std::error_code ec;
    if (!std::filesystem::exists(file, ec)) {
        return registry;
    }

    std::ifstream in{file};
    if (!in) {
        LOG_ERROR("could not open registry file {}", file.string());
        return RegistryError::ConfigUnreadable;
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(in);
    }
    catch (nlohmann::json::parse_error const &e) {
        LOG_ERROR("registry file {}: {}", file.string(), e.what());
        return RegistryError::ConfigMalformed;
    }

    auto const tools = j.find("tools");
    if (!j.is_object() || tools == j.end() || !tools->is_array()) {
        LOG_ERROR("registry file {}: expected a \"tools\" array", file.string());
        return RegistryError::ConfigMalformed;
    }

    for (auto const &j_tool : *tools) {
        std::string name;
        std::string path;
        std::vector<std::string> args;
        Dialect dialect = Dialect::Json;
        try {
            name = j_tool.at("name").get<std::string>();
            path = j_tool.at("path").get<std::string>();
            if (j_tool.contains("args")) {
                args = j_tool.at("args").get<std::vector<std::string>>();
            }
            if (j_tool.contains("dialect")) {
                auto const tag = j_tool.at("dialect").get<std::string>();
                auto const it = dialect_map.find(tag);
                if (it == dialect_map.end()) {
                    LOG_ERROR(
                        "registry file {}: unknown dialect {} for tool {}",
                        file.string(),
                        tag,
                        name);
                    return RegistryError::ConfigMalformed;
                }
                dialect = it->second;
            }
        }
        catch (nlohmann::json::exception const &e) {
            LOG_ERROR("registry file {}: {}", file.string(), e.what());
            return RegistryError::ConfigMalformed;
        }

        auto const res = registry.register_tool(name, path, args, dialect);
        if (res.has_error()) {
            LOG_WARNING(
                "dropping tool {} from {}: {}",
                name,
                file.string(),
                res.error().message().c_str());
        }
    }
    return registry;
}

Result<void>
save_registry(ToolRegistry const &registry, std::filesystem::path const &file)
{
    nlohmann::json tools = nlohmann::json::array();
    for (auto const &entry : registry.list()) {
        tools.push_back(
            {{"name", entry.name},
             {"path", entry.path.string()},
             {"args", entry.args},
             {"dialect", std::string{to_string(entry.dialect)}}});
    }
    nlohmann::json const j = {{"tools", std::move(tools)}};

    auto tmp = file;
    tmp += ".tmp";
    {
        std::ofstream out{tmp, std::ios::trunc};
        out << j.dump(4) << '\n';
        if (!out) {
            LOG_ERROR("could not write registry file {}", tmp.string());
            return RegistryError::ConfigWriteFailed;
        }
    }
    std::error_code ec;
    std::filesystem::rename(tmp, file, ec);
    if (ec) {
        LOG_ERROR(
            "could not replace registry file {}: {}",
            file.string(),
            ec.message());
        std::filesystem::remove(tmp, ec);
        return RegistryError::ConfigWriteFailed;
    }
    return outcome::success();
}

TESTETH_NAMESPACE_END
