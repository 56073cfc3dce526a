#pragma once

#include <cstdarg>
#include <cstdio>
#include <string>

namespace vdc {
namespace trace {

/// Receives one prefixed line without a trailing newline.
using Sink = void (*)(const std::string& line);

inline Sink& currentSink() {
    static Sink sink = nullptr;
    return sink;
}

/// Route trace lines to `sink`; stderr when none is set.
inline void setSink(Sink sink) { currentSink() = sink; }
inline void resetSink() { currentSink() = nullptr; }

inline std::string format(const char* fmt, va_list args) {
    va_list sizing;
    va_copy(sizing, args);
    int length = std::vsnprintf(nullptr, 0, fmt, sizing);
    va_end(sizing);
    if (length <= 0) return std::string();

    std::string text(static_cast<size_t>(length), '\0');
    std::vsnprintf(&text[0], text.size() + 1, fmt, args);
    return text;
}

inline void emit(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    std::string line = "[vdc] " + format(fmt, args);
    va_end(args);

    if (Sink sink = currentSink()) {
        sink(line);
    } else {
        std::fprintf(stderr, "%s\n", line.c_str());
    }
}

} // namespace trace
} // namespace vdc

#ifdef VDC_ENABLE_DEBUG_OUTPUT
    #define VDC_DEBUG_LOG(fmt, ...) ::vdc::trace::emit(fmt, ##__VA_ARGS__)
#else
    #define VDC_DEBUG_LOG(fmt, ...) ((void)0)
#endif
