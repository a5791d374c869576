#include "arg.h"
#include "jsonrpc.h"
#include "log.h"
#include "mcp-config.h"
#include "mcp.hpp"

#include <csignal>
#include <cstdio>

// Pick the command to spawn: an entry of --mcp-config if given, else --server without arguments
static bool resolve_server_command(const mcp_call_params & params, mcp_stdio_command & cmd) {
    if (params.mcp_config.empty()) {
        cmd.argv = { params.server };
        return true;
    }

    auto config = mcp_config::from_file(params.mcp_config);
    if (!config) {
        LOG_ERR("error: failed to load MCP config from %s\n", params.mcp_config.c_str());
        return false;
    }

    auto server = config->get_server(params.mcp_server);
    if (!server) {
        if (params.mcp_server.empty()) {
            LOG_ERR("error: %s defines %zu MCP servers, select one with --mcp-server\n",
                    params.mcp_config.c_str(), config->mcp_servers.size());
        } else {
            LOG_ERR("error: no MCP server named '%s' in %s\n", params.mcp_server.c_str(), params.mcp_config.c_str());
        }
        return false;
    }

    if (!server->is_stdio()) {
        LOG_ERR("error: MCP server '%s' is a remote server (%s), only stdio servers can be called\n",
                server->name.c_str(), server->url.c_str());
        return false;
    }

    LOG_DBG("%s: using MCP server '%s' from %s\n", __func__, server->name.c_str(), params.mcp_config.c_str());

    cmd.argv = server->argv();
    cmd.env  = server->env;
    return true;
}

static void print_stream(const char * label, const std::string & text) {
    printf("%s\n", label);
    fwrite(text.data(), 1, text.size(), stdout);
    printf("\n");
}

int main(int argc, char ** argv) {
    mcp_call_params params;

    if (!mcp_call_params_parse(argc, argv, params)) {
        return 1;
    }

    if (params.usage) {
        auto ctx_arg = mcp_call_params_parser_init(params);
        mcp_call_params_print_usage(stdout, argv[0], ctx_arg);
        return 0;
    }

    mcp_call_log_set_verbosity_thold(params.verbosity);

    // a server that exits without reading its stdin must not take us down with it
    signal(SIGPIPE, SIG_IGN);

    mcp_stdio_command cmd;
    if (!resolve_server_command(params, cmd)) {
        return 1;
    }

    const mcp_jsonrpc_request request(params.method, params.params);
    const std::string request_json = request.dump();

    printf("Request that would be sent to MCP server:\n");
    printf("%s\n", request_json.c_str());
    printf("\nTo test with a running server, use:\n");
    printf("%s\n", mcp_jsonrpc_pipe_command(request, cmd.argv).c_str());

    if (!params.execute) {
        return 0;
    }

    printf("\nExecuting against MCP server:\n");
    fflush(stdout);

    const auto result = mcp_stdio_exchange(cmd, request_json, std::chrono::seconds(params.timeout));

    switch (result.status) {
        case MCP_STDIO_OK:
            LOG_DBG("%s: server exited with status %d\n", __func__, result.exit_code);
            printf("\nResponse:\n");
            if (!result.err.empty()) {
                print_stream("STDERR:", result.err);
            }
            print_stream("STDOUT:", result.out);
            break;
        case MCP_STDIO_TIMEOUT:
            LOG_ERR("Error: Command timed out after %d seconds\n", params.timeout);
            break;
        case MCP_STDIO_ERROR:
            LOG_ERR("Error executing command: %s\n", result.error.c_str());
            break;
    }

    fflush(stdout);

    // execution failures are reported, not fatal
    return 0;
}
