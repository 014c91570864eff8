/**
 * @file logger.hpp
 * @brief Verbose progress trace for decode runs.
 *
 * A disabled Logger formats nothing, so the Controller can call it
 * unconditionally.
 */

#ifndef UNRAVEL_LOGGER_HPP
#define UNRAVEL_LOGGER_HPP

#include "config.hpp"

#include <cstdio>
#include <string>
#include <string_view>

namespace unravel {

inline constexpr const char* LOG_SEP_MAJOR =
    "======================================================================";
inline constexpr const char* LOG_SEP_MINOR =
    "----------------------------------------------------------------------";

/**
 * @brief Truncate a text for display, appending "..." when cut.
 */
std::string text_preview(std::string_view text, std::size_t max_length = TEXT_PREVIEW_LENGTH);

class Logger {
public:
    Logger() noexcept = default;
    Logger(bool enabled, std::FILE* stream) noexcept
        : enabled_(enabled && stream != nullptr), stream_(stream) {}

    [[nodiscard]] bool enabled() const noexcept {
        return enabled_;
    }

    /// printf-style line; a trailing newline is added.
    void info(const char* format, ...) const;

    /// Blank line followed by "--- title ---".
    void section(const char* title) const;

    /// Write a pre-formatted block verbatim, followed by a newline.
    void write(std::string_view text) const;

private:
    bool enabled_ = false;
    std::FILE* stream_ = nullptr;
};

} // namespace unravel

#endif // UNRAVEL_LOGGER_HPP
