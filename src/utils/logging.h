#ifndef ARBOR_UTILS_LOGGING_H
#define ARBOR_UTILS_LOGGING_H

#include "arbor/slice.h"
#include <cstdio>
#include <string>

namespace Arbor {

inline auto append_escaped_string(std::string &out, const Slice &value) -> void
{
    for (Size i {}; i < value.size(); ++i) {
        const auto chr = value[i];
        if (chr >= ' ' && chr <= '~') {
            out.push_back(chr);
        } else {
            char buffer[10];
            std::snprintf(buffer, sizeof(buffer), "\\x%02x", static_cast<unsigned>(chr) & 0xFF);
            out.append(buffer);
        }
    }
}

inline auto escape_string(const Slice &value) -> std::string
{
    std::string out;
    append_escaped_string(out, value);
    return out;
}

} // namespace Arbor

#endif // ARBOR_UTILS_LOGGING_H
