#pragma once

#include <cstdio>

#ifndef __GNUC__
#    define LOG_ATTRIBUTE_FORMAT(...)
#elif defined(__MINGW32__)
#    define LOG_ATTRIBUTE_FORMAT(...) __attribute__((format(gnu_printf, __VA_ARGS__)))
#else
#    define LOG_ATTRIBUTE_FORMAT(...) __attribute__((format(printf, __VA_ARGS__)))
#endif

#define LOG_DEFAULT_DEBUG 1

enum mcp_call_log_level {
    MCP_CALL_LOG_LEVEL_NONE  = 0,
    MCP_CALL_LOG_LEVEL_DEBUG = 1,
    MCP_CALL_LOG_LEVEL_INFO  = 2,
    MCP_CALL_LOG_LEVEL_WARN  = 3,
    MCP_CALL_LOG_LEVEL_ERROR = 4,
};

// needed by the LOG_TMPL macro to avoid computing log arguments if the verbosity lower
// set via mcp_call_log_set_verbosity_thold()
extern int mcp_call_log_verbosity_thold;

void mcp_call_log_set_verbosity_thold(int verbosity); // not thread-safe

// messages are written synchronously to stderr; stdout only carries the report
struct mcp_call_log;

struct mcp_call_log * mcp_call_log_main(); // singleton, automatically destroys itself on exit

LOG_ATTRIBUTE_FORMAT(3, 4)
void mcp_call_log_add(struct mcp_call_log * log, enum mcp_call_log_level level, const char * fmt, ...);

// helper macros for logging
// use these to avoid computing log arguments if the verbosity is lower than the threshold
//
// for example:
//
//   LOG_DBG("this is a debug message: %d\n", expensive_function());
//
// this will avoid calling expensive_function() if the verbosity is lower than LOG_DEFAULT_DEBUG
//

#define LOG_TMPL(level, verbosity, ...) \
    do { \
        if ((verbosity) <= mcp_call_log_verbosity_thold) { \
            mcp_call_log_add(mcp_call_log_main(), (level), __VA_ARGS__); \
        } \
    } while (0)

#define LOG(...)             LOG_TMPL(MCP_CALL_LOG_LEVEL_NONE, 0,         __VA_ARGS__)
#define LOGV(verbosity, ...) LOG_TMPL(MCP_CALL_LOG_LEVEL_NONE, verbosity, __VA_ARGS__)

#define LOG_INF(...) LOG_TMPL(MCP_CALL_LOG_LEVEL_INFO,  0,                 __VA_ARGS__)
#define LOG_WRN(...) LOG_TMPL(MCP_CALL_LOG_LEVEL_WARN,  0,                 __VA_ARGS__)
#define LOG_ERR(...) LOG_TMPL(MCP_CALL_LOG_LEVEL_ERROR, 0,                 __VA_ARGS__)
#define LOG_DBG(...) LOG_TMPL(MCP_CALL_LOG_LEVEL_DEBUG, LOG_DEFAULT_DEBUG, __VA_ARGS__)

#define LOG_INFV(verbosity, ...) LOG_TMPL(MCP_CALL_LOG_LEVEL_INFO,  verbosity, __VA_ARGS__)
#define LOG_WRNV(verbosity, ...) LOG_TMPL(MCP_CALL_LOG_LEVEL_WARN,  verbosity, __VA_ARGS__)
#define LOG_ERRV(verbosity, ...) LOG_TMPL(MCP_CALL_LOG_LEVEL_ERROR, verbosity, __VA_ARGS__)
#define LOG_DBGV(verbosity, ...) LOG_TMPL(MCP_CALL_LOG_LEVEL_DEBUG, verbosity, __VA_ARGS__)
