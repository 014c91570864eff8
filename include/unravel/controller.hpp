/**
 * @file controller.hpp
 * @brief Iterative decode controller.
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
 * One iteration:
 * 1. Analyze the current text
 * 2. Score every encoding
 * 3. Select a decoder (above 0.3, ties by priority), else fall back to
 *    the first decoder in priority order that changes the text
 * 4. Apply it
 * 5. Validate the new text against the previous one
 * 6. Record the step in the Session
 * 7. Stop on COMPLETE, FAILED, the iteration cap or a loop; else repeat
 *
 * A run never throws to its caller: unexpected errors end the run with
 * status FAILED and the error text as the completion reason.
 */

#ifndef UNRAVEL_CONTROLLER_HPP
#define UNRAVEL_CONTROLLER_HPP

#include "classifier.hpp"
#include "config.hpp"
#include "decoders.hpp"
#include "error.hpp"
#include "logger.hpp"
#include "session.hpp"
#include "validator.hpp"

#include <cstdio>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace unravel {

/**
 * @brief Runtime configuration of a Controller.
 */
struct Options {
    int max_iterations = DEFAULT_MAX_ITERATIONS; ///< Iteration cap (> 0)
    bool verbose = false;                        ///< Trace every step
    std::FILE* log_stream = stdout;              ///< Destination of the trace

    /**
     * @brief Check the options.
     * @return Error::Ok, or Error::InvalidArg for a non-positive cap
     */
    [[nodiscard]] Error validate() const noexcept {
        return max_iterations > 0 ? Error::Ok : Error::InvalidArg;
    }
};

/**
 * @brief Result record of a top-level decode.
 */
struct RunResult {
    bool success = false;
    SessionStatus status = SessionStatus::Failed;
    std::string original_text;
    std::string final_text;
    std::vector<Encoding> encoding_chain;
    std::size_t iterations = 0;
    std::string reason;
    std::vector<double> confidence_scores;
    std::vector<std::string> history; ///< Original, every intermediate, final
};

/// Flatten a finished session into a RunResult.
RunResult make_run_result(const SessionSnapshot& session);

/**
 * @brief Orchestrates decode runs.
 *
 * Holds only configuration; every run gets its own Session, so one
 * Controller may serve many sequential decode() calls.
 */
class Controller {
public:
    /**
     * @brief Construct a controller.
     *
     * @param options Runtime options
     * @param decoders Decoder table
     * @param validators Validation chain
     * @throws InvalidArgumentException if @p options fail validation
     */
    explicit Controller(Options options = Options{}, DecoderSet decoders = default_decoders(),
                        ValidatorChain validators = default_validator_chain());

    /**
     * @brief Decode a text and return the finished session.
     */
    SessionSnapshot run(std::string_view text);

    /**
     * @brief Decode a text and return the flattened result.
     */
    RunResult decode(std::string_view text);

    [[nodiscard]] const Options& options() const noexcept {
        return options_;
    }

private:
    struct Attempt {
        Encoding encoding;
        std::string text;
        double confidence;
    };

    bool iterate(Session& session);
    std::optional<Attempt> try_selected(Session& session, const std::string& current,
                                        const DecoderChoice& choice);
    std::optional<Attempt> try_alternatives(Session& session, const std::string& current);

    Options options_;
    DecoderSet decoders_;
    ValidatorChain validators_;
    Logger log_;
};

/**
 * @brief One-shot decode.
 *
 * Invalid options produce a FAILED result instead of an exception.
 */
RunResult iterative_decode(std::string_view text, int max_iterations = DEFAULT_MAX_ITERATIONS,
                           bool verbose = false);

} // namespace unravel

#endif // UNRAVEL_CONTROLLER_HPP
