// Various helper functions and utilities

#pragma once

#include <string>

#ifdef __GNUC__
#    if defined(__MINGW32__) && !defined(__clang__)
#        define MCP_CALL_COMMON_ATTRIBUTE_FORMAT(...) __attribute__((format(gnu_printf, __VA_ARGS__)))
#    else
#        define MCP_CALL_COMMON_ATTRIBUTE_FORMAT(...) __attribute__((format(printf, __VA_ARGS__)))
#    endif
#else
#    define MCP_CALL_COMMON_ATTRIBUTE_FORMAT(...)
#endif

//
// String utils
//

MCP_CALL_COMMON_ATTRIBUTE_FORMAT(1, 2)
std::string string_format(const char * fmt, ...);
