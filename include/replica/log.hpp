#pragma once

/** \file log.hpp
 *  \brief Tagged diagnostic lines written to std::cerr, filtered by level
 *
 *  Lines have the form `[REPLICA][component] message`. The threshold is read once
 *  from REPLICA_LOG_LEVEL (trace|debug|info|warn|error|off) and defaults to warn.
 */

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <sstream>
#include <string_view>

namespace replica::log {

enum class Level : std::uint8_t { Trace, Debug, Info, Warn, Error, Off };

[[nodiscard]] auto parse_level(std::string_view text) noexcept -> std::optional<Level>;
[[nodiscard]] auto level_name(Level level) noexcept -> std::string_view;

/** \brief Current threshold; initialized from the environment on first use. */
[[nodiscard]] auto level() noexcept -> Level;
auto set_level(Level level) noexcept -> void;

/** \brief Redirect output; nullptr restores std::cerr. */
auto set_sink(std::ostream* sink) noexcept -> void;

[[nodiscard]] auto enabled(Level level) noexcept -> bool;

auto write(Level level, std::string_view component, std::string_view message) -> void;

/** \brief Stream-style helper: `log::line(Level::Debug, "entity", "status=", code)`. */
template <typename... Parts>
auto line(Level lvl, std::string_view component, const Parts&... parts) -> void {
    if (!enabled(lvl)) return;
    std::ostringstream os;
    (os << ... << parts);
    write(lvl, component, os.str());
}

} // namespace replica::log
