#pragma once

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

using json = nlohmann::ordered_json;

// MCP server entry (from JSON config file)
// Remote HTTP entries are parsed so they can be reported, but only stdio servers can be called
struct mcp_server_config {
    std::string name;

    // Remote HTTP server configuration
    std::string url;

    // Local stdio server configuration
    std::string command;                          // Command to spawn (e.g., "npx", "python")
    std::vector<std::string> args;                // Command arguments
    std::map<std::string, std::string> env;       // Environment variables

    mcp_server_config() = default;
    mcp_server_config(const std::string & name, const json & j);

    bool is_remote() const { return !url.empty(); }
    bool is_stdio()  const { return !command.empty(); }

    // command followed by args
    std::vector<std::string> argv() const;

    json to_json() const;
};

// MCP config file structure, the same shape MCP clients use:
// {
//   "mcpServers": {
//     "vagrant": {
//       "command": "./bin/vagrant-mcp-server",
//       "args": [],
//       "env": { "VAGRANT_HOME": "/tmp/vagrant" }
//     },
//     "remote-api": {
//       "url": "http://127.0.0.1:38180/mcp"
//     }
//   }
// }
struct mcp_config {
    std::map<std::string, mcp_server_config> mcp_servers;

    // Load from JSON file, nullopt if missing or malformed
    static std::optional<mcp_config> from_file(const std::string & path);

    // Parse from an already loaded document
    // Throws std::invalid_argument / json exceptions on a malformed document
    static mcp_config from_json(const json & j);

    // Get server config by name
    // With an empty name, the only configured server is returned (if there is exactly one)
    std::optional<mcp_server_config> get_server(const std::string & name) const;
};
