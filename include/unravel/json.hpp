/**
 * @file json.hpp
 * @brief JSON serialization of analyses, sessions and run results.
 *
 * Provides nlohmann::json ADL hooks, so `nlohmann::json j = record;`
 * works for every type below.
 */

#ifndef UNRAVEL_JSON_HPP
#define UNRAVEL_JSON_HPP

#include "controller.hpp"
#include "session.hpp"
#include "text_analyzer.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace unravel {

void to_json(nlohmann::json& j, const AttemptSummary& attempt);
void to_json(nlohmann::json& j, const SessionExport& record);
void to_json(nlohmann::json& j, const RunResult& result);
void to_json(nlohmann::json& j, const TextAnalysis& analysis);

/**
 * @brief Serialize with two-space indentation.
 *
 * Decoded text is not guaranteed to be valid UTF-8; invalid sequences
 * are replaced with U+FFFD instead of throwing.
 */
std::string dump_json(const nlohmann::json& j);

} // namespace unravel

#endif // UNRAVEL_JSON_HPP
