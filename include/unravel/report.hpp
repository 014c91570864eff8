/**
 * @file report.hpp
 * @brief Human-readable analysis tables and run summaries.
 */

#ifndef UNRAVEL_REPORT_HPP
#define UNRAVEL_REPORT_HPP

#include "session.hpp"
#include "text_analyzer.hpp"

#include <string>
#include <string_view>

namespace unravel {

/**
 * @brief Render every feature of an analysis as a table.
 *
 * Example:
 * @code
 * ======================================================================
 * TEXT ANALYSIS
 * ======================================================================
 * Text: SGVsbG8gV29ybGQh
 * Length: 16 characters
 * Character Set: base64
 * ...
 * @endcode
 */
std::string format_analysis(const TextAnalysis& analysis);

/// Analyze @p text and render the table.
std::string format_analysis(std::string_view text);

/**
 * @brief Render a summary of a finished run.
 *
 * Status, reason, iteration count, original and final text previews,
 * the encoding chain joined by " -> " and the confidence per step.
 */
std::string format_result_summary(const SessionSnapshot& session);

} // namespace unravel

#endif // UNRAVEL_REPORT_HPP
