/**
 * @file config.hpp
 * @brief unravel compile-time configuration.
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
 * Iterative decoding of layered text encodings (Base64, Hex, ROT13,
 * percent-encoding).
 */

#ifndef UNRAVEL_CONFIG_HPP
#define UNRAVEL_CONFIG_HPP

#include <cstddef>
#include <cstdint>

namespace unravel {

/**
 * @defgroup version Version Information
 * @{
 */
inline constexpr int VERSION_MAJOR = 1;
inline constexpr int VERSION_MINOR = 0;
inline constexpr int VERSION_PATCH = 0;
/** @} */

/**
 * @defgroup config Configuration Constants
 * @{
 */

/// Default iteration cap for a decode run
#ifndef UNRAVEL_DEFAULT_MAX_ITERATIONS
#define UNRAVEL_DEFAULT_MAX_ITERATIONS 10
#endif

inline constexpr int DEFAULT_MAX_ITERATIONS = UNRAVEL_DEFAULT_MAX_ITERATIONS;

/// Characters of text shown in log lines and analysis tables
inline constexpr std::size_t TEXT_PREVIEW_LENGTH = 60U;

/// Characters of text shown in result summaries
inline constexpr std::size_t SUMMARY_PREVIEW_LENGTH = 100U;

/// Characters of text kept per attempted (text, decoder) pair on export
inline constexpr std::size_t ATTEMPT_SNIPPET_LENGTH = 50U;

/** @} */

/**
 * @defgroup thresholds Analysis Thresholds
 * @{
 */
inline constexpr double ENTROPY_HIGH_THRESHOLD = 5.5; ///< Above: likely still encoded
inline constexpr double ENTROPY_LOW_THRESHOLD = 4.5;  ///< Below: natural language
inline constexpr double PRINTABLE_RATIO_HIGH = 0.95;
inline constexpr double PRINTABLE_RATIO_LOW = 0.80;
inline constexpr double ALPHABETIC_RATIO = 0.70;

inline constexpr std::size_t MD5_LENGTH = 32U;
inline constexpr std::size_t SHA1_LENGTH = 40U;
inline constexpr std::size_t SHA256_LENGTH = 64U;
/** @} */

/**
 * @defgroup confidence Confidence Constants
 * @{
 */

// Decoder selection
inline constexpr double SELECTION_THRESHOLD = 0.3;
inline constexpr double FALLBACK_CONFIDENCE = 0.7;

// Encoding identification
inline constexpr double CONFIDENCE_BASE64_WITH_PADDING = 0.95;
inline constexpr double CONFIDENCE_BASE64_CHARSET = 0.85;
inline constexpr double CONFIDENCE_HEX_EVEN_LENGTH = 0.95;
inline constexpr double CONFIDENCE_ROT13_ALPHABETIC = 0.70;
inline constexpr double CONFIDENCE_URL_PERCENT = 0.90;

// Validators
inline constexpr double CONFIDENCE_NO_CHANGE = 0.0;
inline constexpr double CONFIDENCE_FLAG = 0.99;
inline constexpr double CONFIDENCE_URL = 0.85;
inline constexpr double CONFIDENCE_HASH = 0.80;
inline constexpr double CONFIDENCE_NATURAL_LANGUAGE = 0.90;
inline constexpr double CONFIDENCE_STILL_ENCODED = 0.60;
inline constexpr double CONFIDENCE_IMPROVED_READABILITY = 0.50;
inline constexpr double CONFIDENCE_AMBIGUOUS = 0.45;
/** @} */

} // namespace unravel

#endif // UNRAVEL_CONFIG_HPP
