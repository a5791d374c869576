#include "log.h"

#include <cstdarg>
#include <mutex>
#include <vector>

int mcp_call_log_verbosity_thold = 0;

void mcp_call_log_set_verbosity_thold(int verbosity) {
    mcp_call_log_verbosity_thold = verbosity;
}

struct mcp_call_log {
    std::mutex mtx;

    std::vector<char> msg = std::vector<char>(256);

    void add(enum mcp_call_log_level level, const char * fmt, va_list args) {
        std::lock_guard<std::mutex> lock(mtx);

        va_list args_copy;
        va_copy(args_copy, args);

        const size_t n = vsnprintf(msg.data(), msg.size(), fmt, args);
        if (n >= msg.size()) {
            msg.resize(n + 1);
            vsnprintf(msg.data(), msg.size(), fmt, args_copy);
        }
        va_end(args_copy);

        // debug output is interleaved with the tool's own diagnostics, mark it
        if (level == MCP_CALL_LOG_LEVEL_DEBUG) {
            fprintf(stderr, "D ");
        }
        fprintf(stderr, "%s", msg.data());
        fflush(stderr);
    }
};

struct mcp_call_log * mcp_call_log_main() {
    static struct mcp_call_log log;

    return &log;
}

void mcp_call_log_add(struct mcp_call_log * log, enum mcp_call_log_level level, const char * fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log->add(level, fmt, args);
    va_end(args);
}
