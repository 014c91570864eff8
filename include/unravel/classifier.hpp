/**
 * @file classifier.hpp
 * @brief Heuristic encoding identification and decoder selection.
 *
 * @cond INTERNAL
 * ============================================================================
 *  _____                                   ____
 * |_   _|_ _ _ __   __ _  __ _ _ __ __ _  / ___| _ __   __ _  ___ ___
 *   | |/ _` | '_ \ / _` |/ _` | '__/ _` | \___ \| '_ \ / _` |/ __/ _ \
 *   | | (_| | | | | (_| | (_| | | | (_| |  ___) | |_) | (_| | (_|  __/
 *   |_|\__,_|_| |_|\__,_|\__, |_|  \__,_| |____/| .__/ \__,_|\___\___|
 *                        |___/                  |_|
 * ============================================================================
 * @endcond
 *
 * Maps a TextAnalysis to an independent confidence per encoding:
 *
 * | Encoding | Condition                              | Confidence |
 * |----------|----------------------------------------|------------|
 * | base64   | charset base64, padded                 | 0.95       |
 * | base64   | charset base64, unpadded               | 0.85       |
 * | hex      | charset hex, even length               | 0.95       |
 * | rot13    | charset alphabetic                     | 0.70       |
 * | url      | '%' anywhere                           | 0.90       |
 *
 * Anything else scores 0.0. Odd-length hex scores 0.0 because it can
 * never decode.
 */

#ifndef UNRAVEL_CLASSIFIER_HPP
#define UNRAVEL_CLASSIFIER_HPP

#include "encoding.hpp"
#include "text_analyzer.hpp"

#include <optional>

namespace unravel {

/**
 * @brief A selected decoder and the confidence it was selected with.
 */
struct DecoderChoice {
    Encoding encoding = Encoding::None;
    double confidence = 0.0;
};

/**
 * @brief Score every known encoding against an analysis.
 *
 * @param analysis Features of the current text
 * @return Confidence per encoding, each in [0, 1]
 */
EncodingScores identify_likely_encoding(const TextAnalysis& analysis) noexcept;

/**
 * @brief Pick the highest-scoring encoding above a threshold.
 *
 * Equal maxima resolve by PRIORITY_ORDER (base64 > hex > rot13 > url).
 *
 * @param scores Confidence map
 * @param threshold Scores must be strictly greater than this
 * @return The choice, or std::nullopt when nothing clears the threshold
 */
std::optional<DecoderChoice> select_decoder(const EncodingScores& scores,
                                            double threshold = SELECTION_THRESHOLD) noexcept;

} // namespace unravel

#endif // UNRAVEL_CLASSIFIER_HPP
