/**
 * @file report.cpp
 * @brief Report formatting.
 */

#include <unravel/logger.hpp>
#include <unravel/report.hpp>

#include <cstdarg>
#include <cstdio>

namespace unravel {

namespace {

void appendf(std::string& out, const char* format, ...) {
    char line[256];
    va_list args;
    va_start(args, format);
    int written = std::vsnprintf(line, sizeof(line), format, args);
    va_end(args);
    if (written > 0) {
        out.append(line, static_cast<std::size_t>(written) < sizeof(line)
                             ? static_cast<std::size_t>(written)
                             : sizeof(line) - 1);
    }
}

const char* yes_no(bool value) noexcept {
    return value ? "True" : "False";
}

} // namespace

std::string format_analysis(const TextAnalysis& analysis) {
    std::string out;
    out += LOG_SEP_MAJOR;
    out += "\nTEXT ANALYSIS\n";
    out += LOG_SEP_MAJOR;
    out += "\nText: " + text_preview(analysis.text) + "\n";
    appendf(out, "Length: %zu characters\n", analysis.length);
    appendf(out, "Character Set: %s\n", charset_name(analysis.charset));
    appendf(out, "Printable Ratio: %.2f%%\n", analysis.printable_ratio * 100.0);
    appendf(out, "Entropy: %.2f bits/char\n", analysis.entropy);
    appendf(out, "Has Padding (=): %s\n", yes_no(analysis.has_padding));
    appendf(out, "Contains URL: %s\n", yes_no(analysis.contains_url));
    appendf(out, "Contains Flag: %s\n", yes_no(analysis.contains_flag));
    appendf(out, "Hash Type: %s\n", hash_type_name(analysis.hash_type));
    out += LOG_SEP_MAJOR;
    return out;
}

std::string format_analysis(std::string_view text) {
    return format_analysis(analyze(text));
}

std::string format_result_summary(const SessionSnapshot& session) {
    std::string out;
    out += LOG_SEP_MAJOR;
    out += "\nDECODING RESULT SUMMARY\n";
    out += LOG_SEP_MAJOR;
    out += '\n';

    appendf(out, "Status: %s\n", session.is_complete() ? "COMPLETE" : "INCOMPLETE");
    out += "Reason: " + session.completion_reason() + "\n";
    appendf(out, "Iterations: %zu/%zu\n\n", session.iteration_count(), session.max_iterations());

    appendf(out, "Original Text (%zu chars):\n", session.original_text().size());
    out += "  " + text_preview(session.original_text(), SUMMARY_PREVIEW_LENGTH) + "\n\n";
    appendf(out, "Final Text (%zu chars):\n", session.current_text().size());
    out += "  " + text_preview(session.current_text(), SUMMARY_PREVIEW_LENGTH) + "\n\n";

    out += "Encoding Chain: ";
    if (session.encoding_chain().empty()) {
        out += "None";
    } else {
        for (std::size_t i = 0; i < session.encoding_chain().size(); ++i) {
            if (i > 0) {
                out += " -> ";
            }
            out += encoding_name(session.encoding_chain()[i]);
        }
    }
    out += '\n';

    out += "Confidence Scores: [";
    for (std::size_t i = 0; i < session.confidence_scores().size(); ++i) {
        appendf(out, i > 0 ? ", %.2f" : "%.2f", session.confidence_scores()[i]);
    }
    out += "]\n";
    out += LOG_SEP_MAJOR;
    return out;
}

} // namespace unravel
