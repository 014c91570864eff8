/**
 * @file test_session.cpp
 * @brief Unit tests for session bookkeeping and loop detection.
 */

#include <catch2/catch_test_macros.hpp>
#include <unravel/session.hpp>

#include <string>
#include <vector>

using namespace unravel;

static void require_invariants(const Session& s) {
    REQUIRE(s.history().size() == s.iteration_count() + 1);
    REQUIRE(s.history().front() == s.original_text());
    REQUIRE(s.history().back() == s.current_text());
    REQUIRE(s.encoding_chain().size() == s.iteration_count());
    REQUIRE(s.confidence_scores().size() == s.iteration_count());
}

TEST_CASE("New session", "[session]") {
    Session s("SGk=", 10);
    REQUIRE(s.is_running());
    REQUIRE(s.status() == SessionStatus::Running);
    REQUIRE(s.current_text() == "SGk=");
    REQUIRE(s.iteration_count() == 0);
    REQUIRE(s.max_iterations() == 10);
    REQUIRE(s.completion_reason().empty());
    REQUIRE_FALSE(s.iteration_limit_reached());
    require_invariants(s);
}

TEST_CASE("Recording steps", "[session]") {
    Session s("NDg2NTZjNmM2Zg==", 2);

    REQUIRE(s.record_decode(Encoding::Base64, "48656c6c6f", 0.95) == Error::Ok);
    require_invariants(s);
    REQUIRE(s.current_text() == "48656c6c6f");
    REQUIRE(s.was_attempted("NDg2NTZjNmM2Zg==", Encoding::Base64));
    REQUIRE_FALSE(s.iteration_limit_reached());

    REQUIRE(s.record_decode(Encoding::Hex, "Hello", 0.95) == Error::Ok);
    require_invariants(s);
    REQUIRE(s.iteration_limit_reached());

    std::vector<Encoding> chain = {Encoding::Base64, Encoding::Hex};
    REQUIRE(s.encoding_chain() == chain);
    REQUIRE(s.history() == std::vector<std::string>{"NDg2NTZjNmM2Zg==", "48656c6c6f", "Hello"});
}

TEST_CASE("Sentinel encoding is rejected", "[session]") {
    Session s("abc", 5);
    REQUIRE(s.record_decode(Encoding::None, "xyz", 0.5) == Error::InvalidArg);
    REQUIRE(s.iteration_count() == 0);
    require_invariants(s);
}

TEST_CASE("No-progress iteration", "[session]") {
    Session s("!@#", 5);
    REQUIRE(s.record_no_progress() == Error::Ok);
    require_invariants(s);
    REQUIRE(s.iteration_count() == 1);
    REQUIRE(s.encoding_chain().front() == Encoding::None);
    REQUIRE(s.confidence_scores().front() == 0.0);
    REQUIRE(s.history() == std::vector<std::string>{"!@#", "!@#"});
}

TEST_CASE("Attempt tracking", "[session]") {
    Session s("text", 5);
    REQUIRE_FALSE(s.was_attempted("text", Encoding::Rot13));
    REQUIRE(s.mark_attempted("text", Encoding::Rot13) == Error::Ok);
    REQUIRE(s.was_attempted("text", Encoding::Rot13));
    REQUIRE_FALSE(s.was_attempted("text", Encoding::Url));
    REQUIRE_FALSE(s.was_attempted("other", Encoding::Rot13));

    // Marking twice keeps one entry
    REQUIRE(s.mark_attempted("text", Encoding::Rot13) == Error::Ok);
    REQUIRE(s.snapshot().attempted_count() == 1);
}

TEST_CASE("Finishing freezes the session", "[session]") {
    Session s("abc", 5);
    REQUIRE(s.finish(SessionStatus::Running, "nope") == Error::InvalidArg);
    REQUIRE(s.is_running());

    REQUIRE(s.finish(SessionStatus::Complete, "Flag format detected") == Error::Ok);
    REQUIRE(s.status() == SessionStatus::Complete);
    REQUIRE(s.completion_reason() == "Flag format detected");

    REQUIRE(s.finish(SessionStatus::Failed, "again") == Error::InvalidState);
    REQUIRE(s.record_decode(Encoding::Rot13, "nop", 0.7) == Error::InvalidState);
    REQUIRE(s.record_no_progress() == Error::InvalidState);
    REQUIRE(s.mark_attempted("abc", Encoding::Hex) == Error::InvalidState);

    REQUIRE(s.status() == SessionStatus::Complete);
    REQUIRE(s.completion_reason() == "Flag format detected");
    require_invariants(s);
}

TEST_CASE("Snapshots are independent copies", "[session]") {
    Session s("SGk=", 5);
    REQUIRE(s.record_decode(Encoding::Base64, "Hi", 0.95) == Error::Ok);

    SessionSnapshot snap = s.snapshot();
    REQUIRE(s.record_decode(Encoding::Rot13, "Uv", 0.7) == Error::Ok);

    REQUIRE(snap.iteration_count() == 1);
    REQUIRE(snap.current_text() == "Hi");
    REQUIRE(snap.history().size() == 2);
    REQUIRE_FALSE(snap.is_complete());
}

TEST_CASE("Loop detection", "[session]") {
    using History = std::vector<std::string>;

    SECTION("short histories") {
        REQUIRE(detect_loop(History{}) == LoopKind::None);
        REQUIRE(detect_loop(History{"a"}) == LoopKind::None);
    }

    SECTION("no loop") {
        REQUIRE(detect_loop(History{"a", "b", "c", "d"}) == LoopKind::None);
    }

    SECTION("no change") {
        REQUIRE(detect_loop(History{"a", "b", "b"}) == LoopKind::NoChange);
    }

    SECTION("period two oscillation") {
        REQUIRE(detect_loop(History{"a", "b", "a", "b"}) == LoopKind::Oscillation);
    }

    SECTION("oscillation is reported before the other checks") {
        REQUIRE(detect_loop(History{"a", "a", "a", "a"}) == LoopKind::Oscillation);
    }

    SECTION("exact repeat") {
        REQUIRE(detect_loop(History{"a", "b", "a"}) == LoopKind::ExactRepeat);
    }

    SECTION("period three surfaces as exact repeat") {
        REQUIRE(detect_loop(History{"a", "b", "c", "a"}) == LoopKind::ExactRepeat);
        REQUIRE(detect_loop(History{"a", "b", "c", "a", "b", "c"}) == LoopKind::ExactRepeat);
    }

    SECTION("through a session") {
        Session s("abc", 10);
        REQUIRE(s.record_decode(Encoding::Rot13, "nop", 0.7) == Error::Ok);
        REQUIRE(s.detect_loop() == LoopKind::None);
        REQUIRE(s.record_decode(Encoding::Rot13, "abc", 0.7) == Error::Ok);
        REQUIRE(s.detect_loop() == LoopKind::ExactRepeat);
    }
}

TEST_CASE("Export record", "[session]") {
    Session s(std::string(80, 'A'), 4);
    REQUIRE(s.mark_attempted(s.current_text(), Encoding::Hex) == Error::Ok);
    REQUIRE(s.record_decode(Encoding::Rot13, std::string(80, 'N'), 0.7) == Error::Ok);
    REQUIRE(s.finish(SessionStatus::StoppedMaxIter, "max_iterations_reached") == Error::Ok);

    SessionExport record = s.snapshot().export_record();
    REQUIRE(record.original_text == std::string(80, 'A'));
    REQUIRE(record.final_text == std::string(80, 'N'));
    REQUIRE(record.encoding_chain == std::vector<std::string>{"rot13"});
    REQUIRE(record.iterations == 1);
    REQUIRE(record.max_iterations == 4);
    REQUIRE_FALSE(record.complete);
    REQUIRE(record.status == "STOPPED_MAX_ITER");
    REQUIRE(record.reason == "max_iterations_reached");
    REQUIRE(record.history.size() == 2);
    REQUIRE(record.attempted_count == 2);
    REQUIRE(record.attempted.size() == 2);
    for (const auto& attempt : record.attempted) {
        REQUIRE(attempt.text_snippet == std::string(50, 'A'));
    }
}

TEST_CASE("Status names", "[session]") {
    REQUIRE(std::string(session_status_name(SessionStatus::Running)) == "RUNNING");
    REQUIRE(std::string(session_status_name(SessionStatus::StoppedLoop)) == "STOPPED_LOOP");
    REQUIRE(std::string(loop_kind_name(LoopKind::Oscillation)) == "oscillation");
}
