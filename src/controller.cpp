/**
 * @file controller.cpp
 * @brief Decode loop, decoder selection and termination.
 */

#include <unravel/classifier.hpp>
#include <unravel/controller.hpp>
#include <unravel/report.hpp>
#include <unravel/text_analyzer.hpp>

#include <cstdio>
#include <exception>

namespace unravel {

namespace {

void check(Error error, const char* operation) {
    if (error != Error::Ok) {
        throw InvalidStateException(std::string(operation) + ": " + error_string(error));
    }
}

} // namespace

RunResult make_run_result(const SessionSnapshot& session) {
    RunResult result;
    result.success = session.is_complete();
    result.status = session.status();
    result.original_text = session.original_text();
    result.final_text = session.current_text();
    result.encoding_chain = session.encoding_chain();
    result.iterations = session.iteration_count();
    result.reason = session.completion_reason();
    result.confidence_scores = session.confidence_scores();
    result.history = session.history();
    return result;
}

Controller::Controller(Options options, DecoderSet decoders, ValidatorChain validators)
    : options_(options)
    , decoders_(decoders)
    , validators_(std::move(validators))
    , log_(options.verbose, options.log_stream)
{
    if (options_.validate() != Error::Ok) {
        throw InvalidArgumentException("max_iterations must be positive");
    }
}

std::optional<Controller::Attempt> Controller::try_selected(Session& session,
                                                            const std::string& current,
                                                            const DecoderChoice& choice) {
    const std::string name(encoding_name(choice.encoding));
    log_.info("Step 3: Applying '%s' decoder...", name.c_str());

    check(session.mark_attempted(current, choice.encoding), "mark_attempted");
    DecodeResult result = decoders_.apply(choice.encoding, current);
    if (!result.ok()) {
        log_.info("  Decoder '%s' failed: %s", name.c_str(), result.message.c_str());
        return std::nullopt;
    }
    if (result.text == current) {
        log_.info("  Decoder '%s' produced no change", name.c_str());
        return std::nullopt;
    }

    log_.info("  Decode succeeded: %s", text_preview(result.text).c_str());
    return Attempt{choice.encoding, std::move(result.text), choice.confidence};
}

std::optional<Controller::Attempt> Controller::try_alternatives(Session& session,
                                                                const std::string& current) {
    log_.info("  Trying alternative decoders...");

    for (Encoding encoding : PRIORITY_ORDER) {
        if (session.was_attempted(current, encoding)) {
            continue;
        }
        check(session.mark_attempted(current, encoding), "mark_attempted");

        DecodeResult result = decoders_.apply(encoding, current);
        if (!result.ok() || result.text == current) {
            continue;
        }

        log_.info("  Alternative decoder '%s' succeeded", std::string(encoding_name(encoding)).c_str());
        return Attempt{encoding, std::move(result.text), FALLBACK_CONFIDENCE};
    }

    return std::nullopt;
}

bool Controller::iterate(Session& session) {
    // Copy: recording the step replaces the session's current text
    const std::string current = session.current_text();

    char title[48];
    std::snprintf(title, sizeof(title), "Iteration %zu", session.iteration_count() + 1);
    log_.section(title);
    log_.info("Current text: %s", text_preview(current).c_str());

    log_.info("Step 1: Analyzing text characteristics...");
    TextAnalysis analysis = analyze(current);
    log_.info("  Charset: %s", charset_name(analysis.charset));
    log_.info("  Length: %zu", analysis.length);
    log_.info("  Entropy: %.2f", analysis.entropy);
    log_.info("  Printable ratio: %.2f%%", analysis.printable_ratio * 100.0);

    log_.info("Step 2: Identifying likely encoding...");
    EncodingScores scores = identify_likely_encoding(analysis);
    for (Encoding encoding : PRIORITY_ORDER) {
        if (session.was_attempted(current, encoding)) {
            scores.set(encoding, 0.0);
        }
    }

    std::optional<Attempt> attempt;
    if (auto choice = select_decoder(scores)) {
        log_.info("  Selected decoder: '%s' (confidence: %.2f)",
                  std::string(encoding_name(choice->encoding)).c_str(), choice->confidence);
        attempt = try_selected(session, current, *choice);
    } else {
        log_.info("  No decoder above confidence threshold");
    }

    if (!attempt) {
        attempt = try_alternatives(session, current);
    }

    if (!attempt) {
        log_.info("  All decoders failed");
        check(session.record_no_progress(), "record_no_progress");
        check(session.finish(SessionStatus::Failed, "no_progress"), "finish");
        return false;
    }

    log_.info("Step 4: Validating result...");
    ValidationResult validation = validators_.run(current, analyze(attempt->text));
    log_.info("  Validation status: %s", validation_status_name(validation.status));
    log_.info("  Reason: %s", validation.reason.c_str());
    log_.info("  Confidence: %.2f", validation.confidence);

    check(session.record_decode(attempt->encoding, std::move(attempt->text), attempt->confidence),
          "record_decode");

    log_.info("Step 5: Decision point...");

    if (validation.status == ValidationStatus::Complete) {
        log_.info("  Status: COMPLETE - Stopping iteration");
        check(session.finish(SessionStatus::Complete, validation.reason), "finish");
        return false;
    }

    if (validation.status == ValidationStatus::Failed) {
        log_.info("  Status: FAILED - No progress made");
        check(session.finish(SessionStatus::Failed, validation.reason), "finish");
        return false;
    }

    if (session.iteration_limit_reached()) {
        log_.info("  Maximum iterations reached - Stopping iteration");
        check(session.finish(SessionStatus::StoppedMaxIter, "max_iterations_reached"), "finish");
        return false;
    }

    LoopKind loop = session.detect_loop();
    if (loop != LoopKind::None) {
        log_.info("  Loop detected (%s) - Stopping iteration", loop_kind_name(loop));
        check(session.finish(SessionStatus::StoppedLoop, "loop_detected"), "finish");
        return false;
    }

    log_.info("  Status: PARTIAL - Continuing iteration");
    return true;
}

SessionSnapshot Controller::run(std::string_view text) {
    Session session(std::string(text), static_cast<std::size_t>(options_.max_iterations));

    log_.info("\nStarting iterative decoding...");
    log_.info("Input text: %s", text_preview(text).c_str());

    try {
        while (iterate(session)) {
        }
    } catch (const std::exception& e) {
        log_.info("\nError during decoding: %s", e.what());
        if (session.is_running()) {
            // Running -> Failed is always a legal transition
            static_cast<void>(session.finish(SessionStatus::Failed, std::string("error: ") + e.what()));
        }
    } catch (...) {
        // Injected decoders and validators may throw non-standard types
        log_.info("\nError during decoding: unknown");
        if (session.is_running()) {
            static_cast<void>(session.finish(SessionStatus::Failed, "error: unknown"));
        }
    }

    SessionSnapshot snapshot = session.snapshot();
    if (log_.enabled()) {
        log_.write("\n" + format_result_summary(snapshot));
    }
    return snapshot;
}

RunResult Controller::decode(std::string_view text) {
    return make_run_result(run(text));
}

RunResult iterative_decode(std::string_view text, int max_iterations, bool verbose) {
    Options options;
    options.max_iterations = max_iterations;
    options.verbose = verbose;

    if (options.validate() != Error::Ok) {
        Session session{std::string(text), 0};
        static_cast<void>(session.finish(SessionStatus::Failed,
                                         "error: max_iterations must be positive"));
        return make_run_result(session.snapshot());
    }

    Controller controller(options);
    return controller.decode(text);
}

} // namespace unravel
