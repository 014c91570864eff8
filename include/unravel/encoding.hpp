/**
 * @file encoding.hpp
 * @brief The closed set of encodings unravel knows how to undo.
 */

#ifndef UNRAVEL_ENCODING_HPP
#define UNRAVEL_ENCODING_HPP

#include "config.hpp"

#include <array>
#include <optional>
#include <string_view>

namespace unravel {

/**
 * @brief Known encodings.
 *
 * Enumerator order is the fixed priority order used for tie-breaks and
 * for the fallback sweep: base64 > hex > rot13 > url.
 */
enum class Encoding : std::uint8_t {
    Base64 = 0,
    Hex,
    Rot13,
    Url,
    None ///< Sentinel recorded for an iteration that made no progress
};

inline constexpr std::size_t ENCODING_COUNT = 4U;

/// Decodable encodings in priority order.
inline constexpr std::array<Encoding, ENCODING_COUNT> PRIORITY_ORDER = {
    Encoding::Base64, Encoding::Hex, Encoding::Rot13, Encoding::Url};

/**
 * @brief Get the canonical lower-case name of an encoding.
 */
constexpr std::string_view encoding_name(Encoding encoding) noexcept {
    switch (encoding) {
    case Encoding::Base64:
        return "base64";
    case Encoding::Hex:
        return "hex";
    case Encoding::Rot13:
        return "rot13";
    case Encoding::Url:
        return "url";
    case Encoding::None:
        return "none";
    }
    return "none";
}

/**
 * @brief Look up an encoding by its canonical name.
 * @return The encoding, or std::nullopt for unknown names
 */
constexpr std::optional<Encoding> encoding_from_name(std::string_view name) noexcept {
    for (Encoding e : PRIORITY_ORDER) {
        if (encoding_name(e) == name) {
            return e;
        }
    }
    return std::nullopt;
}

constexpr std::size_t encoding_index(Encoding encoding) noexcept {
    return static_cast<std::size_t>(encoding);
}

/**
 * @brief Confidence per decodable encoding, each in [0, 1].
 *
 * Scores are independent: several encodings may be non-zero at once.
 */
class EncodingScores {
public:
    constexpr double operator[](Encoding encoding) const noexcept {
        return encoding == Encoding::None ? 0.0 : scores_[encoding_index(encoding)];
    }

    constexpr void set(Encoding encoding, double confidence) noexcept {
        if (encoding == Encoding::None) {
            return;
        }
        if (confidence < 0.0) {
            confidence = 0.0;
        } else if (confidence > 1.0) {
            confidence = 1.0;
        }
        scores_[encoding_index(encoding)] = confidence;
    }

private:
    std::array<double, ENCODING_COUNT> scores_{};
};

} // namespace unravel

#endif // UNRAVEL_ENCODING_HPP
