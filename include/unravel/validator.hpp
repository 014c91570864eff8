/**
 * @file validator.hpp
 * @brief Ordered chain of predicates judging a decode outcome.
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
 * The standard chain, in evaluation order:
 * 1. no change              FAILED    0.00
 * 2. flag pattern           COMPLETE  0.99
 * 3. URL                    COMPLETE  0.85
 * 4. hash digest            COMPLETE  0.80
 * 5. natural language       COMPLETE  0.90
 *    (skipped for even-length hex whose bytes are printable UTF-8 text,
 *    which is still a decodable layer)
 * 6. still encoded          PARTIAL   0.60
 * 7. improved readability   PARTIAL   0.50
 * 8. ambiguous (default)    PARTIAL   0.45
 *
 * The first validator returning a result wins.
 */

#ifndef UNRAVEL_VALIDATOR_HPP
#define UNRAVEL_VALIDATOR_HPP

#include "text_analyzer.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace unravel {

enum class ValidationStatus : std::uint8_t {
    Complete,
    Partial,
    Failed
};

const char* validation_status_name(ValidationStatus status) noexcept;

/**
 * @brief Verdict on one decode step.
 */
struct ValidationResult {
    ValidationStatus status = ValidationStatus::Partial;
    std::string reason;
    double confidence = 0.0;          ///< in [0, 1]
    const char* validator = "";       ///< Name of the validator that decided
};

using ValidateFn = std::optional<ValidationResult> (*)(std::string_view original,
                                                       const TextAnalysis& decoded);

/**
 * @brief A named validation rule.
 */
struct Validator {
    const char* name;
    ValidateFn fn;
};

/**
 * @brief Ordered, explicitly constructed list of validators.
 */
class ValidatorChain {
public:
    ValidatorChain() = default;
    explicit ValidatorChain(std::vector<Validator> validators)
        : validators_(std::move(validators)) {}

    void append(Validator validator) {
        validators_.push_back(validator);
    }

    [[nodiscard]] std::size_t size() const noexcept {
        return validators_.size();
    }

    [[nodiscard]] const std::vector<Validator>& validators() const noexcept {
        return validators_;
    }

    /**
     * @brief Evaluate the chain.
     *
     * @param original Text before the decode step
     * @param decoded Analysis of the text after the decode step
     * @return First non-empty verdict, or the ambiguous default when every
     *         validator declines
     */
    ValidationResult run(std::string_view original, const TextAnalysis& decoded) const;

private:
    std::vector<Validator> validators_;
};

// Standard validators, in chain order
std::optional<ValidationResult> validate_no_change(std::string_view original, const TextAnalysis& decoded);
std::optional<ValidationResult> validate_flag(std::string_view original, const TextAnalysis& decoded);
std::optional<ValidationResult> validate_url(std::string_view original, const TextAnalysis& decoded);
std::optional<ValidationResult> validate_hash(std::string_view original, const TextAnalysis& decoded);
std::optional<ValidationResult> validate_natural_language(std::string_view original, const TextAnalysis& decoded);
std::optional<ValidationResult> validate_still_encoded(std::string_view original, const TextAnalysis& decoded);
std::optional<ValidationResult> validate_improved_readability(std::string_view original, const TextAnalysis& decoded);
std::optional<ValidationResult> validate_default(std::string_view original, const TextAnalysis& decoded);

/// The eight standard validators in evaluation order.
ValidatorChain default_validator_chain();

/**
 * @brief Analyze @p decoded and run it through a chain.
 */
ValidationResult validate_decoded_result(std::string_view original, std::string_view decoded,
                                         const ValidatorChain& chain = default_validator_chain());

} // namespace unravel

#endif // UNRAVEL_VALIDATOR_HPP
