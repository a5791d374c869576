#include "jsonrpc.h"

#include <cctype>
#include <cstring>
#include <stdexcept>

json mcp_jsonrpc_request::to_json() const {
    json request = {
        {"jsonrpc", MCP_JSONRPC_VERSION},
        {"id",      MCP_JSONRPC_ID},
        {"method",  method},
    };
    if (params) {
        request["params"] = *params;
    }
    return request;
}

std::string mcp_jsonrpc_request::dump() const {
    // replace invalid UTF-8 instead of throwing, the method name comes straight from argv
    return to_json().dump(-1, ' ', false, json::error_handler_t::replace);
}

json mcp_jsonrpc_parse_params(const std::string & text) {
    try {
        return json::parse(text);
    } catch (const json::parse_error & e) {
        throw std::invalid_argument("Invalid JSON: " + text + " (" + e.what() + ")");
    }
}

std::string mcp_shell_quote(const std::string & text) {
    std::string quoted = "'";
    for (char c : text) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

static bool shell_word_is_safe(const std::string & word) {
    if (word.empty()) {
        return false;
    }
    for (char c : word) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && std::strchr("@%+=:,./_-", c) == nullptr) {
            return false;
        }
    }
    return true;
}

std::string mcp_shell_join(const std::vector<std::string> & argv) {
    std::string cmd;
    for (const auto & word : argv) {
        if (!cmd.empty()) {
            cmd += ' ';
        }
        cmd += shell_word_is_safe(word) ? word : mcp_shell_quote(word);
    }
    return cmd;
}

std::string mcp_jsonrpc_pipe_command(const mcp_jsonrpc_request & request, const std::vector<std::string> & argv) {
    return "echo " + mcp_shell_quote(request.dump()) + " | " + mcp_shell_join(argv);
}
