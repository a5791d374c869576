#include "arg.h"

#include "common.h"
#include "jsonrpc.h"
#include "log.h"

#include <algorithm>
#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

//
// mcp_call_arg
//

mcp_call_arg & mcp_call_arg::set_env(const char * env) {
    help = help + "\n(env: " + env + ")";
    this->env = env;
    return *this;
}

bool mcp_call_arg::get_value_from_env(std::string & output) const {
    if (env == nullptr) return false;
    char * value = std::getenv(env);
    if (value) {
        output = value;
        return true;
    }
    return false;
}

bool mcp_call_arg::has_value_from_env() const {
    return env != nullptr && std::getenv(env);
}

static std::vector<std::string> break_str_into_lines(const std::string & input, size_t max_char_per_line) {
    std::vector<std::string> result;
    std::istringstream iss(input);
    std::string line;
    while (std::getline(iss, line)) {
        std::istringstream line_stream(line);
        std::string word;
        std::string current;
        while (line_stream >> word) {
            if (!current.empty() && current.size() + 1 + word.size() > max_char_per_line) {
                result.push_back(current);
                current.clear();
            }
            current += (current.empty() ? "" : " ") + word;
        }
        result.push_back(current);
    }
    return result;
}

std::string mcp_call_arg::names() const {
    std::string res;
    for (const auto & arg : args) {
        res += (res.empty() ? "" : ", ") + std::string(arg);
    }
    if (value_hint) {
        res += std::string(" ") + value_hint;
    }
    return res;
}

std::string mcp_call_arg::to_string(size_t help_column) const {
    const std::string indent(MCP_CALL_USAGE_INDENT, ' ');
    const std::string name_col = names();
    help_column = std::max(help_column, name_col.size() + 2);

    std::string res = indent + name_col + std::string(help_column - name_col.size(), ' ');

    // wrap help to the terminal width, but never squeeze it below 40 columns
    const size_t used  = MCP_CALL_USAGE_INDENT + help_column;
    const size_t width = used + 40 < MCP_CALL_USAGE_WIDTH ? MCP_CALL_USAGE_WIDTH - used : 40;
    const auto help_lines = break_str_into_lines(help, width);
    for (size_t i = 0; i < help_lines.size(); i++) {
        if (i > 0) {
            res += indent + std::string(help_column, ' ');
        }
        res += help_lines[i] + "\n";
    }
    return res;
}

size_t mcp_call_usage_column(const mcp_call_params_context & ctx_arg) {
    size_t widest = 0;
    for (const auto & opt : ctx_arg.options) {
        widest = std::max(widest, opt.names().size());
    }
    return std::min<size_t>(widest + 2, MCP_CALL_USAGE_MAX_COLUMN);
}

//
// CLI argument parsing functions
//

static int parse_int(const std::string & value) {
    size_t pos = 0;
    int result = std::stoi(value, &pos);
    if (pos != value.size()) {
        throw std::invalid_argument("not an integer: " + value);
    }
    return result;
}

static bool mcp_call_params_parse_ex(int argc, char ** argv, mcp_call_params_context & ctx_arg) {
    mcp_call_params & params = ctx_arg.params;

    std::unordered_map<std::string, mcp_call_arg *> arg_to_options;
    for (auto & opt : ctx_arg.options) {
        for (const auto & arg : opt.args) {
            arg_to_options[arg] = &opt;
        }
    }

    // the method is positional and comes first, so "-h" is the only option accepted in its place
    const std::string first = argv[1];
    if (first == "-h" || first == "--help") {
        params.usage = true;
        return true;
    }
    params.method = first;

    // handle environment variables
    for (auto & opt : ctx_arg.options) {
        std::string value;
        if (opt.get_value_from_env(value)) {
            try {
                if (opt.handler_void && (value == "1" || value == "true")) {
                    opt.handler_void(params);
                }
                if (opt.handler_int) {
                    opt.handler_int(params, parse_int(value));
                }
                if (opt.handler_string) {
                    opt.handler_string(params, value);
                    continue;
                }
            } catch (std::exception & e) {
                throw std::invalid_argument(string_format(
                    "error while handling environment variable \"%s\": %s\n\n", opt.env, e.what()));
            }
        }
    }

    // handle command line arguments
    auto check_arg = [&](int i) {
        if (i+1 >= argc) {
            throw std::invalid_argument("expected value for argument");
        }
    };

    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];

        if (!arg.empty() && arg[0] == '{') {
            if (params.params) {
                LOG_WRN("warn: more than one params argument given, using the last one: %s\n", arg.c_str());
            }
            try {
                params.params = mcp_jsonrpc_parse_params(arg);
            } catch (const std::invalid_argument & e) {
                throw std::invalid_argument(string_format("error: %s", e.what()));
            }
            continue;
        }

        if (arg_to_options.find(arg) == arg_to_options.end()) {
            LOG_WRN("warn: ignoring unrecognized argument: %s\n", arg.c_str());
            continue;
        }
        auto opt = *arg_to_options[arg];
        if (opt.has_value_from_env()) {
            LOG_WRN("warn: %s environment variable is set, but will be overwritten by command line argument %s\n", opt.env, arg.c_str());
        }
        try {
            if (opt.handler_void) {
                opt.handler_void(params);
                continue;
            }

            // arg with single value
            check_arg(i);
            std::string val = argv[++i];
            if (opt.handler_int) {
                opt.handler_int(params, parse_int(val));
                continue;
            }
            if (opt.handler_string) {
                opt.handler_string(params, val);
                continue;
            }
        } catch (std::exception & e) {
            throw std::invalid_argument(string_format(
                "error while handling argument \"%s\": %s\n\n"
                "usage:\n%s\n\nto show complete usage, run with -h",
                arg.c_str(), e.what(), arg_to_options[arg]->to_string().c_str()));
        }
    }

    if (!params.mcp_server.empty() && params.mcp_config.empty()) {
        throw std::invalid_argument("error: --mcp-server requires --mcp-config");
    }

    return true;
}

void mcp_call_params_print_usage(FILE * out, const char * program, const mcp_call_params_context & ctx_arg) {
    fprintf(out, "Usage: %s <method> [params_json] [--execute] [options]\n", program);
    fprintf(out, "\n");
    fprintf(out, "Builds a JSON-RPC 2.0 request, prints it, and with --execute sends it to an MCP server over stdio.\n");
    fprintf(out, "\n");
    fprintf(out, "Examples:\n");
    fprintf(out, "  %s initialize\n", program);
    fprintf(out, "  %s tools/list\n", program);
    fprintf(out, "  %s tools/call '{\"name\":\"create_dev_vm\",\"arguments\":{\"name\":\"test-vm\",\"project_path\":\"/path/to/project\"}}'\n", program);
    fprintf(out, "  %s resources/read '{\"uri\":\"devvm://status\"}'\n", program);
    fprintf(out, "  %s initialize '{\"capabilities\": {\"resource_capabilities\": {\"subscribe\": true}}}' --execute\n", program);
    fprintf(out, "\n");
    fprintf(out, "Options:\n");
    const size_t column = mcp_call_usage_column(ctx_arg);
    for (const auto & opt : ctx_arg.options) {
        fprintf(out, "%s", opt.to_string(column).c_str());
    }
}

bool mcp_call_params_parse(int argc, char ** argv, mcp_call_params & params) {
    auto ctx_arg = mcp_call_params_parser_init(params);
    const mcp_call_params params_org = ctx_arg.params;

    const char * program = argc > 0 ? argv[0] : "mcp-call";

    if (argc < 2) {
        fprintf(stderr, "error: no method specified\n\n");
        mcp_call_params_print_usage(stderr, program, ctx_arg);
        return false;
    }

    try {
        if (!mcp_call_params_parse_ex(argc, argv, ctx_arg)) {
            ctx_arg.params = params_org;
            return false;
        }
    } catch (const std::invalid_argument & ex) {
        fprintf(stderr, "%s\n", ex.what());
        ctx_arg.params = params_org;
        return false;
    }

    return true;
}

mcp_call_params_context mcp_call_params_parser_init(mcp_call_params & params) {
    mcp_call_params_context ctx_arg(params);

    ctx_arg.options.push_back(mcp_call_arg(
        {"-h", "--help", "--usage"},
        "print usage and exit",
        [](mcp_call_params & params) {
            params.usage = true;
        }
    ));
    ctx_arg.options.push_back(mcp_call_arg(
        {"--execute"},
        "spawn the server, send it the request and print what it returns",
        [](mcp_call_params & params) {
            params.execute = true;
        }
    ));
    ctx_arg.options.push_back(mcp_call_arg(
        {"--server"}, "PATH",
        string_format("MCP server executable, started without arguments (default: %s)", params.server.c_str()),
        [](mcp_call_params & params, const std::string & value) {
            params.server = value;
        }
    ).set_env("MCP_CALL_SERVER"));
    ctx_arg.options.push_back(mcp_call_arg(
        {"-t", "--timeout"}, "N",
        string_format("seconds to wait for the server to exit before killing it (default: %d)", params.timeout),
        [](mcp_call_params & params, int value) {
            if (value <= 0) {
                throw std::invalid_argument("timeout must be positive");
            }
            params.timeout = value;
        }
    ).set_env("MCP_CALL_TIMEOUT"));
    ctx_arg.options.push_back(mcp_call_arg(
        {"--mcp-config"}, "FNAME",
        "JSON file with an \"mcpServers\" object; the selected entry's command, args and env replace --server",
        [](mcp_call_params & params, const std::string & value) {
            params.mcp_config = value;
        }
    ).set_env("MCP_CALL_CONFIG"));
    ctx_arg.options.push_back(mcp_call_arg(
        {"--mcp-server"}, "NAME",
        "server to use from --mcp-config (default: the only one configured)",
        [](mcp_call_params & params, const std::string & value) {
            params.mcp_server = value;
        }
    ).set_env("MCP_CALL_MCP_SERVER"));
    ctx_arg.options.push_back(mcp_call_arg(
        {"-v", "--verbose"},
        "print debug messages from the harness on stderr",
        [](mcp_call_params & params) {
            params.verbosity = LOG_DEFAULT_DEBUG;
        }
    ).set_env("MCP_CALL_VERBOSE"));

    return ctx_arg;
}
