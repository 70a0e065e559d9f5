/** \file log.cpp
 *  \brief Level filtering and sink handling for tagged diagnostic lines
 */

#include "replica/log.hpp"
#include "replica/core/platform_utils.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace replica::log {

namespace {

Level initial_level() noexcept {
    if (auto v = core::getenv_nonempty("REPLICA_LOG_LEVEL")) {
        if (auto parsed = parse_level(*v)) return *parsed;
    }
    return Level::Warn;
}

std::atomic<Level>& threshold() noexcept {
    static std::atomic<Level> lvl{initial_level()};
    return lvl;
}

std::mutex sink_mutex;
std::ostream* sink_ptr = nullptr;

} // anonymous namespace

auto parse_level(std::string_view text) noexcept -> std::optional<Level> {
    std::string_view names[] = {"trace", "debug", "info", "warn", "error", "off"};
    for (std::size_t i = 0; i < std::size(names); ++i) {
        const auto& name = names[i];
        if (name.size() != text.size()) continue;
        bool same = true;
        for (std::size_t j = 0; j < text.size(); ++j) {
            char c = text[j];
            if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
            if (c != name[j]) { same = false; break; }
        }
        if (same) return static_cast<Level>(i);
    }
    return std::nullopt;
}

auto level_name(Level level) noexcept -> std::string_view {
    switch (level) {
        case Level::Trace: return "trace";
        case Level::Debug: return "debug";
        case Level::Info:  return "info";
        case Level::Warn:  return "warn";
        case Level::Error: return "error";
        case Level::Off:   return "off";
    }
    return "off";
}

auto level() noexcept -> Level { return threshold().load(std::memory_order_relaxed); }

auto set_level(Level lvl) noexcept -> void { threshold().store(lvl, std::memory_order_relaxed); }

auto set_sink(std::ostream* sink) noexcept -> void {
    std::lock_guard lock(sink_mutex);
    sink_ptr = sink;
}

auto enabled(Level lvl) noexcept -> bool {
    return lvl != Level::Off && lvl >= level();
}

auto write(Level lvl, std::string_view component, std::string_view message) -> void {
    if (!enabled(lvl)) return;
    std::lock_guard lock(sink_mutex);
    auto& os = sink_ptr ? *sink_ptr : std::cerr;
    os << "[REPLICA][" << component << "] " << message << std::endl;
}

} // namespace replica::log
