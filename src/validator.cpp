/**
 * @file validator.cpp
 * @brief Standard validators.
 */

#include <unravel/decoders.hpp>
#include <unravel/validator.hpp>

#include <cstdio>

namespace unravel {

namespace {

ValidationResult make_result(ValidationStatus status, std::string reason, double confidence,
                             const char* validator) {
    ValidationResult result;
    result.status = status;
    result.reason = std::move(reason);
    result.confidence = confidence;
    result.validator = validator;
    return result;
}

int hex_digit(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return c - 'A' + 10;
}

// Even-length hex whose bytes are printable UTF-8 text
bool hex_hides_text(const TextAnalysis& decoded) {
    if (decoded.charset != CharsetClass::Hex || (decoded.length % 2U) != 0) {
        return false;
    }
    std::string bytes;
    bytes.reserve(decoded.length / 2U);
    for (std::size_t i = 0; i < decoded.length; i += 2) {
        bytes.push_back(static_cast<char>((hex_digit(decoded.text[i]) << 4) |
                                          hex_digit(decoded.text[i + 1])));
    }
    return is_valid_utf8(bytes) && calculate_printable_ratio(bytes) == 1.0;
}

} // namespace

const char* validation_status_name(ValidationStatus status) noexcept {
    switch (status) {
    case ValidationStatus::Complete:
        return "COMPLETE";
    case ValidationStatus::Partial:
        return "PARTIAL";
    case ValidationStatus::Failed:
        return "FAILED";
    }
    return "PARTIAL";
}

std::optional<ValidationResult> validate_no_change(std::string_view original,
                                                   const TextAnalysis& decoded) {
    if (original == decoded.text) {
        return make_result(ValidationStatus::Failed, "No change after decoding",
                           CONFIDENCE_NO_CHANGE, "no_change");
    }
    return std::nullopt;
}

std::optional<ValidationResult> validate_flag(std::string_view, const TextAnalysis& decoded) {
    if (decoded.contains_flag) {
        return make_result(ValidationStatus::Complete, "Flag format detected", CONFIDENCE_FLAG,
                           "flag");
    }
    return std::nullopt;
}

std::optional<ValidationResult> validate_url(std::string_view, const TextAnalysis& decoded) {
    if (decoded.contains_url) {
        return make_result(ValidationStatus::Complete, "URL detected", CONFIDENCE_URL, "url");
    }
    return std::nullopt;
}

std::optional<ValidationResult> validate_hash(std::string_view, const TextAnalysis& decoded) {
    if (decoded.hash_type != HashType::None) {
        return make_result(ValidationStatus::Complete,
                           std::string(hash_type_name(decoded.hash_type)) + " hash detected",
                           CONFIDENCE_HASH, "hash");
    }
    return std::nullopt;
}

std::optional<ValidationResult> validate_natural_language(std::string_view,
                                                          const TextAnalysis& decoded) {
    // Hex that decodes to readable text is a layer, not plaintext
    if (hex_hides_text(decoded)) {
        return std::nullopt;
    }
    if (decoded.printable_ratio > PRINTABLE_RATIO_HIGH && decoded.entropy < ENTROPY_LOW_THRESHOLD) {
        return make_result(ValidationStatus::Complete,
                           "Natural language detected (high printable ratio, low entropy)",
                           CONFIDENCE_NATURAL_LANGUAGE, "natural_language");
    }
    return std::nullopt;
}

std::optional<ValidationResult> validate_still_encoded(std::string_view,
                                                       const TextAnalysis& decoded) {
    if (decoded.printable_ratio < PRINTABLE_RATIO_LOW || decoded.entropy > ENTROPY_HIGH_THRESHOLD) {
        char reason[96];
        std::snprintf(reason, sizeof(reason),
                      "Still appears encoded (printable=%.2f, entropy=%.2f)",
                      decoded.printable_ratio, decoded.entropy);
        return make_result(ValidationStatus::Partial, reason, CONFIDENCE_STILL_ENCODED,
                           "still_encoded");
    }
    return std::nullopt;
}

std::optional<ValidationResult> validate_improved_readability(std::string_view,
                                                              const TextAnalysis& decoded) {
    if (decoded.printable_ratio > PRINTABLE_RATIO_LOW) {
        return make_result(ValidationStatus::Partial, "Improved readability but still ambiguous",
                           CONFIDENCE_IMPROVED_READABILITY, "improved_readability");
    }
    return std::nullopt;
}

std::optional<ValidationResult> validate_default(std::string_view, const TextAnalysis&) {
    return make_result(ValidationStatus::Partial, "Ambiguous result", CONFIDENCE_AMBIGUOUS,
                       "default");
}

ValidationResult ValidatorChain::run(std::string_view original, const TextAnalysis& decoded) const {
    for (const Validator& validator : validators_) {
        if (validator.fn == nullptr) {
            continue;
        }
        if (auto result = validator.fn(original, decoded)) {
            return *result;
        }
    }
    return *validate_default(original, decoded);
}

ValidatorChain default_validator_chain() {
    return ValidatorChain({
        {"no_change", &validate_no_change},
        {"flag", &validate_flag},
        {"url", &validate_url},
        {"hash", &validate_hash},
        {"natural_language", &validate_natural_language},
        {"still_encoded", &validate_still_encoded},
        {"improved_readability", &validate_improved_readability},
        {"default", &validate_default},
    });
}

ValidationResult validate_decoded_result(std::string_view original, std::string_view decoded,
                                         const ValidatorChain& chain) {
    return chain.run(original, analyze(decoded));
}

} // namespace unravel
