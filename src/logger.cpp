/**
 * @file logger.cpp
 * @brief Logger output.
 */

#include <unravel/logger.hpp>

#include <cstdarg>

namespace unravel {

std::string text_preview(std::string_view text, std::size_t max_length) {
    if (text.size() <= max_length) {
        return std::string(text);
    }
    std::string out(text.substr(0, max_length));
    out += "...";
    return out;
}

void Logger::info(const char* format, ...) const {
    if (!enabled_) {
        return;
    }
    va_list args;
    va_start(args, format);
    std::vfprintf(stream_, format, args);
    va_end(args);
    std::fputc('\n', stream_);
}

void Logger::section(const char* title) const {
    if (!enabled_) {
        return;
    }
    std::fprintf(stream_, "\n--- %s ---\n", title);
}

void Logger::write(std::string_view text) const {
    if (!enabled_) {
        return;
    }
    std::fwrite(text.data(), 1, text.size(), stream_);
    std::fputc('\n', stream_);
}

} // namespace unravel
