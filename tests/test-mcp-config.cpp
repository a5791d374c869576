#include "mcp-config.h"

#include "testing.h"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <unistd.h>

static std::string write_temp_file(const std::string & name, const std::string & content) {
    auto path = std::filesystem::temp_directory_path() / ("test-mcp-config-" + std::to_string(getpid()) + "-" + name);
    std::ofstream f(path);
    f << content;
    return path.string();
}

static void test_parse_entries() {
    auto config = mcp_config::from_json(json::parse(R"({
        "mcpServers": {
            "vagrant": {
                "command": "./bin/vagrant-mcp-server",
                "env": { "VAGRANT_HOME": "/tmp/vagrant" }
            },
            "python": {
                "command": "uvx",
                "args": ["mcp-run-python", "stdio"]
            },
            "remote-api": {
                "url": "http://127.0.0.1:38180/mcp"
            }
        }
    })"));

    assert_equals((size_t) 3, config.mcp_servers.size());

    auto vagrant = config.get_server("vagrant");
    assert_equals(true, vagrant.has_value());
    assert_equals(std::string("vagrant"), vagrant->name);
    assert_equals(true, vagrant->is_stdio());
    assert_equals(false, vagrant->is_remote());
    assert_equals((size_t) 1, vagrant->argv().size());
    assert_equals(std::string("/tmp/vagrant"), vagrant->env.at("VAGRANT_HOME"));

    auto python = config.get_server("python");
    assert_equals(true, python.has_value());
    assert_equals((size_t) 3, python->argv().size());
    assert_equals(std::string("uvx"), python->argv()[0]);
    assert_equals(std::string("stdio"), python->argv()[2]);

    auto remote = config.get_server("remote-api");
    assert_equals(true, remote.has_value());
    assert_equals(true, remote->is_remote());
    assert_equals(false, remote->is_stdio());

    assert_equals(false, config.get_server("missing").has_value());

    // several servers and no name: nothing is picked
    assert_equals(false, config.get_server("").has_value());

    // entries are written back in the same shape
    assert_equals(std::string(R"({"url":"http://127.0.0.1:38180/mcp"})"), remote->to_json().dump());
    assert_equals(std::string(R"({"command":"uvx","args":["mcp-run-python","stdio"]})"), python->to_json().dump());
}

static void test_single_server_default() {
    auto config = mcp_config::from_json(json::parse(R"({"mcpServers": {"only": {"command": "server"}}})"));
    auto server = config.get_server("");
    assert_equals(true, server.has_value());
    assert_equals(std::string("only"), server->name);

    auto empty = mcp_config::from_json(json::parse("{}"));
    assert_equals((size_t) 0, empty.mcp_servers.size());
    assert_equals(false, empty.get_server("").has_value());
}

static void test_malformed() {
    assert_throws<std::exception>([]() { mcp_config::from_json(json::parse("[]")); }, "root is an array");
    assert_throws<std::exception>([]() { mcp_config::from_json(json::parse(R"({"mcpServers": []})")); }, "mcpServers is an array");
    assert_throws<std::exception>([]() { mcp_config::from_json(json::parse(R"({"mcpServers": {"a": 1}})")); }, "entry is a number");
    assert_throws<std::exception>([]() { mcp_config::from_json(json::parse(R"({"mcpServers": {"a": {"command": 1}}})")); }, "command is a number");
}

static void test_from_file() {
    auto path = write_temp_file("ok.json", R"({"mcpServers": {"fake": {"command": "/bin/cat", "args": ["-u"]}}})");
    auto config = mcp_config::from_file(path);
    std::remove(path.c_str());
    assert_equals(true, config.has_value());
    assert_equals(std::string("/bin/cat"), config->get_server("fake")->command);

    auto bad_path = write_temp_file("bad.json", "{ not json");
    auto bad = mcp_config::from_file(bad_path);
    std::remove(bad_path.c_str());
    assert_equals(false, bad.has_value());

    assert_equals(false, mcp_config::from_file("/nonexistent/mcp-config.json").has_value());
}

int main() {
    return run_tests("mcp-config", []() {
        test_parse_entries();
        test_single_server_default();
        test_malformed();
        test_from_file();
    });
}
