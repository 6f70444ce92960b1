// Minimal logging utility (header-only) for OpenXfer core.
// Enabled with OPEN_XFER_LOG=1; OPEN_XFER_LOG=2 also prints debug lines.
#pragma once
#include <cstdio>
#include <cstdlib>
#include <cstdarg>

namespace openxfer {

inline int logLevel() {
    const char* v = std::getenv("OPEN_XFER_LOG");
    if (!v || !*v || *v == '0') return 0;
    return std::atoi(v) > 1 ? 2 : 1;
}

inline bool logEnabled() { return logLevel() > 0; }
inline bool debugLogEnabled() { return logLevel() > 1; }

inline void logf(const char* level, const char* fmt, ...) {
    if (!logEnabled()) return;
    std::fprintf(stderr, "[OpenXfer][%s] ", level);
    va_list ap;
    va_start(ap, fmt);
    std::vfprintf(stderr, fmt, ap);
    va_end(ap);
    std::fprintf(stderr, "\n");
}

} // namespace openxfer

#define LOGD(fmt, ...) \
    do { \
        if (openxfer::debugLogEnabled()) \
            openxfer::logf("DEBUG", fmt, ##__VA_ARGS__); \
    } while (0)

#define LOGI(fmt, ...) \
    do { \
        if (openxfer::logEnabled()) \
            openxfer::logf("INFO", fmt, ##__VA_ARGS__); \
    } while (0)

#define LOGW(fmt, ...) \
    do { \
        if (openxfer::logEnabled()) \
            openxfer::logf("WARN", fmt, ##__VA_ARGS__); \
    } while (0)

#define LOGE(fmt, ...) \
    do { \
        if (openxfer::logEnabled()) \
            openxfer::logf("ERROR", fmt, ##__VA_ARGS__); \
    } while (0)
