#include "mcp-config.h"
#include "log.h"

#include <fstream>
#include <stdexcept>

mcp_server_config::mcp_server_config(const std::string & name, const json & j) : name(name) {
    if (!j.is_object()) {
        throw std::invalid_argument("server entry '" + name + "' is not an object");
    }

    if (j.contains("url")) url = j["url"].get<std::string>();

    if (j.contains("command")) command = j["command"].get<std::string>();
    if (j.contains("args")) {
        const auto & args_arr = j["args"];
        if (args_arr.is_array()) {
            for (const auto & arg : args_arr) {
                args.push_back(arg.get<std::string>());
            }
        }
    }
    if (j.contains("env")) {
        const auto & env_obj = j["env"];
        if (env_obj.is_object()) {
            for (auto it = env_obj.begin(); it != env_obj.end(); ++it) {
                env[it.key()] = it.value().get<std::string>();
            }
        }
    }
}

std::vector<std::string> mcp_server_config::argv() const {
    std::vector<std::string> result;
    result.reserve(args.size() + 1);
    result.push_back(command);
    result.insert(result.end(), args.begin(), args.end());
    return result;
}

json mcp_server_config::to_json() const {
    json j = json::object();
    if (!url.empty()) j["url"] = url;
    if (!command.empty()) j["command"] = command;
    if (!args.empty()) j["args"] = args;
    if (!env.empty()) j["env"] = env;
    return j;
}

mcp_config mcp_config::from_json(const json & j) {
    if (!j.is_object()) {
        throw std::invalid_argument("config root is not an object");
    }

    mcp_config config;
    if (j.contains("mcpServers")) {
        const auto & servers = j["mcpServers"];
        if (!servers.is_object()) {
            throw std::invalid_argument("\"mcpServers\" is not an object");
        }
        for (auto it = servers.begin(); it != servers.end(); ++it) {
            config.mcp_servers[it.key()] = mcp_server_config(it.key(), it.value());
        }
    }
    return config;
}

std::optional<mcp_config> mcp_config::from_file(const std::string & path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        LOG_WRN("%s: failed to open MCP config file: %s\n", __func__, path.c_str());
        return std::nullopt;
    }

    try {
        json j;
        f >> j;

        mcp_config config = from_json(j);

        LOG_DBG("%s: loaded %zu MCP server configurations from %s\n",
                __func__, config.mcp_servers.size(), path.c_str());
        return config;
    } catch (const std::exception & e) {
        LOG_ERR("%s: failed to parse MCP config file: %s: %s\n",
                __func__, path.c_str(), e.what());
        return std::nullopt;
    }
}

std::optional<mcp_server_config> mcp_config::get_server(const std::string & name) const {
    if (name.empty()) {
        if (mcp_servers.size() == 1) {
            return mcp_servers.begin()->second;
        }
        return std::nullopt;
    }

    auto it = mcp_servers.find(name);
    if (it != mcp_servers.end()) {
        return it->second;
    }
    return std::nullopt;
}
