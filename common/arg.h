#pragma once

#include "mcp.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <cstdio>
#include <optional>
#include <string>
#include <vector>

using json = nlohmann::ordered_json;

#define MCP_CALL_DEFAULT_SERVER "./bin/vagrant-mcp-server"

#define MCP_CALL_USAGE_INDENT     2
#define MCP_CALL_USAGE_WIDTH      80
#define MCP_CALL_USAGE_MAX_COLUMN 28

struct mcp_call_params {
    std::string         method;
    std::optional<json> params;     // from the last argument starting with '{'
    bool                execute = false;

    std::string server     = MCP_CALL_DEFAULT_SERVER; // executable to spawn, no arguments
    std::string mcp_config = "";                      // mcpServers config file, takes precedence over server
    std::string mcp_server = "";                      // entry to use from mcp_config
    int32_t     timeout    = MCP_STDIO_DEFAULT_TIMEOUT_S; // seconds

    int32_t     verbosity  = 0;

    bool usage = false; // print usage
};

struct mcp_call_arg {
    std::vector<const char *> args;
    const char * value_hint = nullptr; // help text or example for arg value
    const char * env        = nullptr;
    std::string help;
    void (*handler_void)  (mcp_call_params & params) = nullptr;
    void (*handler_string)(mcp_call_params & params, const std::string &) = nullptr;
    void (*handler_int)   (mcp_call_params & params, int) = nullptr;

    mcp_call_arg(
        const std::initializer_list<const char *> & args_,
        const char * value_hint_,
        const std::string & help_,
        void (*handler)(mcp_call_params & params, const std::string &)
    ) : args(args_), value_hint(value_hint_), help(help_), handler_string(handler) {}

    mcp_call_arg(
        const std::initializer_list<const char *> & args_,
        const char * value_hint_,
        const std::string & help_,
        void (*handler)(mcp_call_params & params, int)
    ) : args(args_), value_hint(value_hint_), help(help_), handler_int(handler) {}

    mcp_call_arg(
        const std::initializer_list<const char *> & args_,
        const std::string & help_,
        void (*handler)(mcp_call_params & params)
    ) : args(args_), help(help_), handler_void(handler) {}

    mcp_call_arg & set_env(const char * val);
    bool get_value_from_env(std::string & output) const;
    bool has_value_from_env() const;
    // "-t, --timeout N"
    std::string names() const;

    // one usage entry; help starts at help_column, or after the names when they are wider
    std::string to_string(size_t help_column = 0) const;
};

struct mcp_call_params_context {
    mcp_call_params & params;
    std::vector<mcp_call_arg> options;
    mcp_call_params_context(mcp_call_params & params_) : params(params_) {}
};

// parse input arguments from CLI
// argv[1] is always the method; options and the params JSON may follow in any order
// returns false (after printing the reason to stderr) on a usage error
bool mcp_call_params_parse(int argc, char ** argv, mcp_call_params & params);

// function to be used by test-arg-parser
mcp_call_params_context mcp_call_params_parser_init(mcp_call_params & params);

// column where option help starts: after the widest option names, capped at MCP_CALL_USAGE_MAX_COLUMN
size_t mcp_call_usage_column(const mcp_call_params_context & ctx_arg);

void mcp_call_params_print_usage(FILE * out, const char * program, const mcp_call_params_context & ctx_arg);
