#include "competix/log.hpp"

#include <atomic>
#include <cstdlib>
#include <cstring>

namespace competix {

namespace {

int parse_level(const char* e) {
    if (e == nullptr) return static_cast<int>(LogLevel::Info);
    if (std::strcmp(e, "error") == 0) return static_cast<int>(LogLevel::Error);
    if (std::strcmp(e, "warn") == 0)  return static_cast<int>(LogLevel::Warn);
    if (std::strcmp(e, "debug") == 0) return static_cast<int>(LogLevel::Debug);
    return static_cast<int>(LogLevel::Info);
}

std::atomic<int>& threshold_slot() {
    static std::atomic<int> slot{parse_level(std::getenv("COMPETIX_LOG"))};
    return slot;
}

}  // namespace

LogLevel log_threshold() {
    return static_cast<LogLevel>(threshold_slot().load(std::memory_order_relaxed));
}

void set_log_threshold(LogLevel level) {
    threshold_slot().store(static_cast<int>(level), std::memory_order_relaxed);
}

}  // namespace competix
