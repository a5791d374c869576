#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

using json = nlohmann::ordered_json;

#define MCP_JSONRPC_VERSION "2.0"
#define MCP_JSONRPC_ID      1

// A single JSON-RPC 2.0 request, as sent to an MCP server over stdio.
// Serialized key order is jsonrpc, id, method, params.
struct mcp_jsonrpc_request {
    std::string         method;
    std::optional<json> params; // omitted from the wire form when not set

    mcp_jsonrpc_request() = default;
    mcp_jsonrpc_request(const std::string & method, const std::optional<json> & params = std::nullopt)
        : method(method), params(params) {}

    json to_json() const;

    // compact, single line, no trailing newline
    std::string dump() const;
};

// Parse a params argument (a token starting with '{').
// Throws std::invalid_argument quoting the offending text when it is not valid JSON.
json mcp_jsonrpc_parse_params(const std::string & text);

// Quote a string for a POSIX shell, e.g. it's -> 'it'\''s'
std::string mcp_shell_quote(const std::string & text);

// Join argv into a shell command line, quoting only the words that need it
std::string mcp_shell_join(const std::vector<std::string> & argv);

// Suggested command line for piping the request into a server by hand:
//   echo '<request>' | <command> <args...>
std::string mcp_jsonrpc_pipe_command(const mcp_jsonrpc_request & request, const std::vector<std::string> & argv);
