#ifndef FILE_ICON_LOG_HPP_
#define FILE_ICON_LOG_HPP_

#include <file_icon/file_icon_export.h>

#include <functional>
#include <string_view>

namespace file_icon::log {

// ============================================================================
// Levels
// ============================================================================

enum class level : int {
    debug,
    info,
    warn,
    error,
    off
};

[[nodiscard]] FILE_ICON_EXPORT const char* to_string(level lvl) noexcept;

// Single-letter prefix used by the default sink: "D::", "I::", "W::", "E::"
[[nodiscard]] FILE_ICON_EXPORT std::string_view prefix(level lvl) noexcept;

// ============================================================================
// Configuration
// ============================================================================

using sink_fn = std::function<void(level, std::string_view)>;

/**
 * Minimum level that reaches the sink. Defaults to `warn`, or to the value
 * of the FILE_ICON_LOG environment variable ("debug", "info", "warn",
 * "error", "off") when set.
 */
FILE_ICON_EXPORT void set_level(level lvl) noexcept;
[[nodiscard]] FILE_ICON_EXPORT level get_level() noexcept;

/**
 * Replace the sink. An empty function restores the default stderr sink.
 */
FILE_ICON_EXPORT void set_sink(sink_fn sink);

[[nodiscard]] FILE_ICON_EXPORT bool enabled(level lvl) noexcept;

FILE_ICON_EXPORT void write(level lvl, std::string_view message);

inline void debug(std::string_view message) { write(level::debug, message); }
inline void info(std::string_view message) { write(level::info, message); }
inline void warn(std::string_view message) { write(level::warn, message); }
inline void error(std::string_view message) { write(level::error, message); }

} // namespace file_icon::log

#endif // FILE_ICON_LOG_HPP_
