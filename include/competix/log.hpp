#ifndef COMPETIX_LOG_HPP
#define COMPETIX_LOG_HPP

#include <cstdio>

namespace competix {

enum class LogLevel : int { Error = 0, Warn = 1, Info = 2, Debug = 3 };

// Threshold read once from COMPETIX_LOG (error|warn|info|debug). Default info.
LogLevel log_threshold();

inline bool log_enabled(LogLevel level) {
    return static_cast<int>(level) <= static_cast<int>(log_threshold());
}

// Override the environment threshold (tests and benchmarks).
void set_log_threshold(LogLevel level);

}  // namespace competix

// Unbuffered stderr logging so progress shows up even when stdout is piped.
#define CX_LOG(level, tag, fmt, ...)                                          \
    do {                                                                      \
        if (::competix::log_enabled(level))                                   \
            std::fprintf(stderr, "[" tag "] " fmt "\n", ##__VA_ARGS__);       \
    } while (0)

#define CX_ERROR(tag, fmt, ...) CX_LOG(::competix::LogLevel::Error, tag, fmt, ##__VA_ARGS__)
#define CX_WARN(tag, fmt, ...)  CX_LOG(::competix::LogLevel::Warn, tag, fmt, ##__VA_ARGS__)
#define CX_INFO(tag, fmt, ...)  CX_LOG(::competix::LogLevel::Info, tag, fmt, ##__VA_ARGS__)
#define CX_DEBUG(tag, fmt, ...) CX_LOG(::competix::LogLevel::Debug, tag, fmt, ##__VA_ARGS__)

#endif  // COMPETIX_LOG_HPP
