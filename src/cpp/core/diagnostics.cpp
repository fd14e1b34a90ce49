#include "diagnostics.hpp"

#include <cstdio>
#include <mutex>
#include <utility>

#include <fmt/core.h>

namespace spacecraft::core {

namespace {

void default_handler(const std::string& line) {
    fmt::print(stderr, "{}\n", line);
}

struct DiagnosticsState {
    std::mutex mutex;
    WarningHandler handler = default_handler;
    bool enabled = true;
    std::size_t count = 0;
};

DiagnosticsState& state() {
    static DiagnosticsState instance;
    return instance;
}

}  // anonymous namespace

void warn(std::string_view source, std::string_view message) {
    DiagnosticsState& s = state();
    WarningHandler handler;
    {
        std::lock_guard<std::mutex> lock(s.mutex);
        if (!s.enabled) {
            return;
        }
        ++s.count;
        handler = s.handler;
    }
    // Called unlocked so the handler may use the channel itself
    handler(fmt::format("[WARNING - {}] - {}", source, message));
}

WarningHandler set_warning_handler(WarningHandler handler) {
    DiagnosticsState& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (!handler) {
        handler = default_handler;
    }
    return std::exchange(s.handler, std::move(handler));
}

void set_warnings_enabled(bool enabled) {
    DiagnosticsState& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.enabled = enabled;
}

bool warnings_enabled() {
    DiagnosticsState& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    return s.enabled;
}

std::size_t warning_count() {
    DiagnosticsState& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    return s.count;
}

void reset_warning_count() {
    DiagnosticsState& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.count = 0;
}

}  // namespace spacecraft::core
