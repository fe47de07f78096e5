#ifndef FUNCSTRUCTS_DEBUG_LOG_HPP
#define FUNCSTRUCTS_DEBUG_LOG_HPP

#include <cstdio>
#include <thread>
#include <sstream>
#include <cstdarg>
#include <atomic>
#include <cstddef>

namespace funcstructs {
namespace debug {

// Callback function type for debug output routing
// The callback receives a formatted string (no newline at end)
using DebugCallback = void (*)(const char* message);

// When null, DEBUG_LOG uses printf
inline std::atomic<DebugCallback> g_debug_callback{nullptr};

inline void set_debug_callback(DebugCallback cb) {
    g_debug_callback.store(cb, std::memory_order_release);
}

inline void clear_debug_callback() {
    g_debug_callback.store(nullptr, std::memory_order_release);
}

// Internal: format and output debug message
inline void debug_output(const char* fmt, ...) {
    char buffer[1024];
    va_list args;
    va_start(args, fmt);
    vsnprintf(buffer, sizeof(buffer), fmt, args);
    va_end(args);

    std::ostringstream oss;
    oss << std::this_thread::get_id();

    char full_message[1100];
    snprintf(full_message, sizeof(full_message), "[DEBUG][T%s] %s", oss.str().c_str(), buffer);

    DebugCallback cb = g_debug_callback.load(std::memory_order_acquire);
    if (cb) {
        cb(full_message);
    } else {
        printf("%s\n", full_message);
        fflush(stdout);
    }
}

} // namespace debug
} // namespace funcstructs

// Debug logging macro - routes to callback if set, otherwise printf
#ifdef ENABLE_DEBUG_OUTPUT
    #define DEBUG_LOG(fmt, ...) ::funcstructs::debug::debug_output(fmt, ##__VA_ARGS__)
#else
    #define DEBUG_LOG(fmt, ...) ((void)0)
#endif

namespace funcstructs {
namespace debug {

// Counts the objects a generator hands out and reports once when it runs dry.
class EmissionTrace {
public:
    explicit EmissionTrace(const char* generator_name = "generator")
        : generator_name_(generator_name) {}

    void emitted() { ++count_; }

    void exhausted() {
        if (!reported_) {
            reported_ = true;
            DEBUG_LOG("%s exhausted after %zu objects", generator_name_, count_);
        }
    }

    std::size_t count() const { return count_; }

private:
    const char* generator_name_;
    std::size_t count_ = 0;
    bool reported_ = false;
};

} // namespace debug
} // namespace funcstructs

#endif // FUNCSTRUCTS_DEBUG_LOG_HPP
