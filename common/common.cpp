#include "common.h"

#include <cstdarg>
#include <cstdio>
#include <stdexcept>
#include <vector>

//
// String utils
//

std::string string_format(const char * fmt, ...) {
    va_list ap;
    va_list ap2;
    va_start(ap, fmt);
    va_copy(ap2, ap);
    int size = vsnprintf(NULL, 0, fmt, ap);
    if (size < 0) {
        va_end(ap2);
        va_end(ap);
        throw std::runtime_error("string_format: invalid format");
    }
    std::vector<char> buf(size + 1);
    vsnprintf(buf.data(), size + 1, fmt, ap2);
    va_end(ap2);
    va_end(ap);
    return std::string(buf.data(), size);
}
