/**
 * @file text_analyzer.hpp
 * @brief Observable features of a candidate text.
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
 * Computes, for one string:
 * - Charset class (empty, hex, base64, alphabetic, printable, binary)
 * - Shannon entropy in bits per character
 * - Printable-ASCII ratio
 * - Base64-style padding, URL, CTF flag and hash digest patterns
 *
 * Every function here is pure. Characters are bytes: a UTF-8 sequence
 * contributes one "character" per byte.
 */

#ifndef UNRAVEL_TEXT_ANALYZER_HPP
#define UNRAVEL_TEXT_ANALYZER_HPP

#include "config.hpp"

#include <string>
#include <string_view>

namespace unravel {

/**
 * @brief Coarse character composition of a string.
 *
 * Mutually exclusive; assigned by fixed priority (first match wins).
 */
enum class CharsetClass : std::uint8_t {
    Empty,
    Hex,
    Base64,
    Alphabetic,
    Printable,
    Binary
};

/**
 * @brief Hash digest shape recognised by exact length and hex content.
 */
enum class HashType : std::uint8_t {
    None,
    Md5,
    Sha1,
    Sha256
};

const char* charset_name(CharsetClass charset) noexcept;
const char* hash_type_name(HashType hash) noexcept;

/**
 * @brief Analysis of one text. Recomputed every iteration, never mutated.
 */
struct TextAnalysis {
    std::string text;
    std::size_t length = 0;
    CharsetClass charset = CharsetClass::Empty;
    double entropy = 0.0;          ///< bits/char, 0.0 for empty input
    double printable_ratio = 0.0;  ///< in [0, 1], 0.0 for empty input
    bool has_padding = false;
    bool contains_url = false;
    bool contains_flag = false;
    HashType hash_type = HashType::None;
};

/**
 * @brief Analyze a text.
 *
 * @param text Text to analyze
 * @return All features of @p text
 */
TextAnalysis analyze(std::string_view text);

/**
 * @brief Classify the character composition of a text.
 *
 * Priority: empty; all hex digits; all Base64 alphabet (A-Za-z0-9+/=);
 * at least 70% ASCII letters; all printable ASCII; otherwise binary.
 */
CharsetClass identify_charset(std::string_view text) noexcept;

/**
 * @brief Shannon entropy over the byte-frequency distribution.
 *
 * H = -sum(p * log2(p)); bounded by log2(min(256, length)).
 */
double calculate_entropy(std::string_view text) noexcept;

/// Fraction of bytes in the printable-ASCII set (0x20-0x7E, \\t \\n \\r \\v \\f).
double calculate_printable_ratio(std::string_view text) noexcept;

/// True iff the right-trimmed text ends with '='.
bool has_padding(std::string_view text) noexcept;

/// True iff the text contains http:// or https:// followed by non-whitespace.
bool contains_url(std::string_view text);

/// True iff the text contains a bracketed CTF flag (flag{..}, HTB{..}, CTF{..}, ...).
bool contains_flag(std::string_view text);

/**
 * @brief Recognise MD5/SHA1/SHA256 digests.
 *
 * The whitespace-trimmed text must be all hex and exactly 32, 40 or 64
 * characters long.
 */
HashType detect_hash(std::string_view text) noexcept;

// Character predicates shared with the decoders
bool is_hex_char(char c) noexcept;
bool is_base64_char(char c) noexcept;
bool is_printable_char(char c) noexcept;
bool is_ascii_whitespace(char c) noexcept;

} // namespace unravel

#endif // UNRAVEL_TEXT_ANALYZER_HPP
