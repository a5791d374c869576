//  End-to-end tests of the mcp-call executable: output, exit status, and execution against
//  test-fake-mcp-server.

#include "mcp.hpp"

#include "testing.h"

#include <csignal>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <unistd.h>

#ifndef MCP_CALL_PATH
#error "MCP_CALL_PATH must point to the mcp-call executable"
#endif
#ifndef FAKE_MCP_SERVER_PATH
#error "FAKE_MCP_SERVER_PATH must point to the test-fake-mcp-server executable"
#endif

static mcp_stdio_result run_mcp_call(const std::vector<std::string> & args) {
    mcp_stdio_command cmd;
    cmd.argv.push_back(MCP_CALL_PATH);
    cmd.argv.insert(cmd.argv.end(), args.begin(), args.end());
    auto result = mcp_stdio_exchange(cmd, "", std::chrono::seconds(30));
    if (!result.ok()) {
        throw std::runtime_error("failed to run mcp-call: " + result.error);
    }
    return result;
}

static std::string write_config(const std::string & name, const std::string & content) {
    auto path = std::filesystem::temp_directory_path() / ("test-mcp-call-" + std::to_string(getpid()) + "-" + name + ".json");
    std::ofstream f(path);
    f << content;
    return path.string();
}

static void test_usage() {
    auto result = run_mcp_call({});
    assert_equals(1, result.exit_code);
    assert_contains(result.err, "Usage:");
    assert_contains(result.err, "tools/call");
    assert_not_contains(result.out, "Request");

    result = run_mcp_call({"--help"});
    assert_equals(0, result.exit_code);
    assert_contains(result.out, "Usage:");
    assert_contains(result.out, "--execute");
}

static void test_print_only() {
    auto result = run_mcp_call({"initialize"});
    assert_equals(0, result.exit_code);
    assert_contains(result.out, "Request that would be sent to MCP server:\n{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"initialize\"}\n");
    assert_contains(result.out, "echo '{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"initialize\"}' | ./bin/vagrant-mcp-server");
    assert_not_contains(result.out, "Executing");

    result = run_mcp_call({"tools/call", "{\"name\":\"first\"}", "{\"name\": \"x\"}"});
    assert_equals(0, result.exit_code);
    assert_contains(result.out, "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"tools/call\",\"params\":{\"name\":\"x\"}}");
    assert_not_contains(result.out, "first");
}

static void test_invalid_params() {
    auto result = run_mcp_call({"tools/call", "{invalid}"});
    assert_equals(1, result.exit_code);
    assert_contains(result.err, "Invalid JSON: {invalid}");
    assert_not_contains(result.out, "Request");
}

static void test_execute() {
    auto result = run_mcp_call({"tools/call", "{\"name\":\"x\"}", "--execute", "--server", FAKE_MCP_SERVER_PATH});
    assert_equals(0, result.exit_code);
    assert_contains(result.out, "Executing against MCP server:");
    assert_contains(result.out, "Response:\nSTDOUT:\n");
    assert_contains(result.out, "\"echo\":{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"tools/call\",\"params\":{\"name\":\"x\"}}");
    assert_not_contains(result.out, "STDERR:");
}

static void test_execute_long_timeout() {
    auto result = run_mcp_call({"initialize", "--execute", "--server", FAKE_MCP_SERVER_PATH, "--timeout", "2147484"});
    assert_equals(0, result.exit_code);
    assert_not_contains(result.err, "timed out");
    assert_contains(result.out, "Response:\nSTDOUT:\n");
}

static void test_verbose_logging() {
    auto quiet = run_mcp_call({"initialize", "--execute", "--server", FAKE_MCP_SERVER_PATH});
    assert_equals(0, quiet.exit_code);
    assert_equals(std::string(), quiet.err);

    auto verbose = run_mcp_call({"initialize", "--execute", "--server", FAKE_MCP_SERVER_PATH, "-v"});
    assert_equals(0, verbose.exit_code);
    assert_contains(verbose.err, std::string("D mcp_stdio_exchange: started ") + FAKE_MCP_SERVER_PATH);
    assert_contains(verbose.err, "exited with status 0");
    // debug output never reaches the report
    assert_not_contains(verbose.out, "D mcp_stdio_exchange");
    assert_equals(quiet.out, verbose.out);
}

static void test_execute_missing_server() {
    auto result = run_mcp_call({"tools/call", "{\"name\":\"x\"}", "--execute", "--server", "/nonexistent/bin/vagrant-mcp-server"});
    assert_equals(0, result.exit_code);
    assert_contains(result.out, "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"tools/call\",\"params\":{\"name\":\"x\"}}");
    assert_contains(result.err, "Error executing command:");
    assert_contains(result.err, "No such file or directory");
    assert_not_contains(result.out, "STDOUT:");
}

static void test_execute_from_config() {
    auto config = write_config("servers", std::string(R"({
        "mcpServers": {
            "chatty": { "command": ")") + FAKE_MCP_SERVER_PATH + R"(", "args": ["stderr"] },
            "stuck":  { "command": ")" + FAKE_MCP_SERVER_PATH + R"(", "env": { "FAKE_MCP_SERVER_MODE": "hang" } },
            "remote": { "url": "http://127.0.0.1:38180/mcp" }
        }
    })");

    auto result = run_mcp_call({"initialize", "--execute", "--mcp-config", config, "--mcp-server", "chatty"});
    assert_equals(0, result.exit_code);
    assert_contains(result.out, std::string(" | ") + FAKE_MCP_SERVER_PATH + " stderr\n");
    assert_contains(result.out, "Response:\nSTDERR:\nfake-mcp-server: received");
    assert_contains(result.out, "STDOUT:\n{\"jsonrpc\":\"2.0\",\"id\":1,\"result\"");

    // the child is killed and none of its output is shown
    result = run_mcp_call({"initialize", "--execute", "--mcp-config", config, "--mcp-server", "stuck", "--timeout", "1"});
    assert_equals(0, result.exit_code);
    assert_contains(result.err, "timed out");
    assert_not_contains(result.out, "Response:");

    result = run_mcp_call({"initialize", "--mcp-config", config, "--mcp-server", "remote"});
    assert_equals(1, result.exit_code);
    assert_contains(result.err, "remote server");

    result = run_mcp_call({"initialize", "--mcp-config", config, "--mcp-server", "missing"});
    assert_equals(1, result.exit_code);

    result = run_mcp_call({"initialize", "--mcp-config", config});
    assert_equals(1, result.exit_code);
    assert_contains(result.err, "--mcp-server");

    std::remove(config.c_str());
}

int main() {
    signal(SIGPIPE, SIG_IGN);

    return run_tests("mcp-call", []() {
        test_usage();
        test_print_only();
        test_invalid_params();
        test_execute();
        test_execute_long_timeout();
        test_verbose_logging();
        test_execute_missing_server();
        test_execute_from_config();
    });
}
