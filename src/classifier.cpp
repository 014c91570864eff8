/**
 * @file classifier.cpp
 * @brief Encoding identification heuristics.
 */

#include <unravel/classifier.hpp>

namespace unravel {

EncodingScores identify_likely_encoding(const TextAnalysis& analysis) noexcept {
    EncodingScores scores;

    if (analysis.charset == CharsetClass::Base64) {
        scores.set(Encoding::Base64, analysis.has_padding ? CONFIDENCE_BASE64_WITH_PADDING
                                                          : CONFIDENCE_BASE64_CHARSET);
    }

    if (analysis.charset == CharsetClass::Hex && (analysis.length % 2U) == 0) {
        scores.set(Encoding::Hex, CONFIDENCE_HEX_EVEN_LENGTH);
    }

    if (analysis.charset == CharsetClass::Alphabetic) {
        scores.set(Encoding::Rot13, CONFIDENCE_ROT13_ALPHABETIC);
    }

    if (analysis.text.find('%') != std::string::npos) {
        scores.set(Encoding::Url, CONFIDENCE_URL_PERCENT);
    }

    return scores;
}

std::optional<DecoderChoice> select_decoder(const EncodingScores& scores,
                                            double threshold) noexcept {
    std::optional<DecoderChoice> best;
    for (Encoding encoding : PRIORITY_ORDER) {
        double confidence = scores[encoding];
        if (confidence <= threshold) {
            continue;
        }
        // Strictly greater: an equal score never displaces a higher-priority one
        if (!best || confidence > best->confidence) {
            best = DecoderChoice{encoding, confidence};
        }
    }
    return best;
}

} // namespace unravel
