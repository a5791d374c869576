#pragma once

#include <chrono>
#include <map>
#include <string>
#include <vector>

#define MCP_STDIO_DEFAULT_TIMEOUT_S 30

// Command used to spawn an MCP stdio server
struct mcp_stdio_command {
    std::vector<std::string> argv;          // argv[0] is the program, looked up in PATH if it has no '/'
    std::map<std::string, std::string> env; // merged over the inherited safe environment
};

enum mcp_stdio_status {
    MCP_STDIO_OK,      // child exited, out/err hold everything it wrote
    MCP_STDIO_TIMEOUT, // child was killed, out/err are left empty
    MCP_STDIO_ERROR,   // spawn or I/O failure, see error
};

struct mcp_stdio_result {
    mcp_stdio_status status = MCP_STDIO_ERROR;
    std::string out;
    std::string err;
    int         exit_code = -1;
    std::string error;

    bool ok() const { return status == MCP_STDIO_OK; }
};

// Spawn the server, write `input` followed by '\n' to its stdin, close stdin and collect
// stdout/stderr until it exits.
// Writing, reading and waiting for exit all share a single deadline of `timeout`.
// The child is always reaped before returning, and killed first if still running.
mcp_stdio_result mcp_stdio_exchange(
    const mcp_stdio_command & cmd,
    const std::string & input,
    std::chrono::milliseconds timeout = std::chrono::seconds(MCP_STDIO_DEFAULT_TIMEOUT_S));

// Environment passed to the child: safe variables from the parent, overridden by `overrides`
std::vector<std::string> mcp_stdio_environment(const std::map<std::string, std::string> & overrides);

const char * mcp_stdio_status_name(mcp_stdio_status status);
