#include <file_icon/log.hpp>

#include <atomic>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <string>

namespace file_icon::log {

namespace {

level level_from_env() {
    const char* value = std::getenv("FILE_ICON_LOG");
    if (!value) {
        return level::warn;
    }
    const std::string_view v{value};
    if (v == "debug") return level::debug;
    if (v == "info")  return level::info;
    if (v == "error") return level::error;
    if (v == "off")   return level::off;
    return level::warn;
}

std::atomic<level>& current_level() {
    static std::atomic<level> lvl{level_from_env()};
    return lvl;
}

struct sink_state {
    std::mutex mutex;
    sink_fn sink;
};

sink_state& state() {
    static sink_state s;
    return s;
}

void default_sink(level lvl, std::string_view message) {
    std::string line;
    line.reserve(message.size() + 16);
    line += prefix(lvl);
    line += "file_icon: ";
    line += message;
    line += '\n';
    std::cerr << line;
}

} // namespace

const char* to_string(level lvl) noexcept {
    switch (lvl) {
        case level::debug: return "debug";
        case level::info:  return "info";
        case level::warn:  return "warn";
        case level::error: return "error";
        case level::off:   return "off";
    }
    return "unknown";
}

std::string_view prefix(level lvl) noexcept {
    switch (lvl) {
        case level::debug: return "D::";
        case level::info:  return "I::";
        case level::warn:  return "W::";
        case level::error: return "E::";
        case level::off:   return "";
    }
    return "";
}

void set_level(level lvl) noexcept {
    current_level().store(lvl, std::memory_order_relaxed);
}

level get_level() noexcept {
    return current_level().load(std::memory_order_relaxed);
}

void set_sink(sink_fn sink) {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    s.sink = std::move(sink);
}

bool enabled(level lvl) noexcept {
    return lvl != level::off && lvl >= get_level();
}

void write(level lvl, std::string_view message) {
    if (!enabled(lvl)) {
        return;
    }

    // Called outside the lock so a sink may log itself
    sink_fn sink;
    {
        auto& s = state();
        std::lock_guard lock(s.mutex);
        sink = s.sink;
    }
    if (sink) {
        sink(lvl, message);
    } else {
        default_sink(lvl, message);
    }
}

} // namespace file_icon::log
