/**
 * @file session.cpp
 * @brief Session bookkeeping and loop detection.
 */

#include <unravel/session.hpp>

namespace unravel {

const char* session_status_name(SessionStatus status) noexcept {
    switch (status) {
    case SessionStatus::Running:
        return "RUNNING";
    case SessionStatus::Complete:
        return "COMPLETE";
    case SessionStatus::Failed:
        return "FAILED";
    case SessionStatus::StoppedMaxIter:
        return "STOPPED_MAX_ITER";
    case SessionStatus::StoppedLoop:
        return "STOPPED_LOOP";
    }
    return "FAILED";
}

const char* loop_kind_name(LoopKind kind) noexcept {
    switch (kind) {
    case LoopKind::None:
        return "none";
    case LoopKind::Oscillation:
        return "oscillation";
    case LoopKind::NoChange:
        return "no_change";
    case LoopKind::ExactRepeat:
        return "exact_repeat";
    }
    return "none";
}

LoopKind detect_loop(const std::vector<std::string>& history) noexcept {
    const std::size_t n = history.size();
    if (n < 2) {
        return LoopKind::None;
    }

    if (n >= 4 && history[n - 1] == history[n - 3] && history[n - 2] == history[n - 4]) {
        return LoopKind::Oscillation;
    }

    if (history[n - 1] == history[n - 2]) {
        return LoopKind::NoChange;
    }

    for (std::size_t i = 0; i + 1 < n; ++i) {
        if (history[i] == history[n - 1]) {
            return LoopKind::ExactRepeat;
        }
    }

    return LoopKind::None;
}

SessionExport SessionSnapshot::export_record() const {
    SessionExport out;
    out.original_text = data_.original_text;
    out.final_text = data_.current_text;
    out.encoding_chain.reserve(data_.encoding_chain.size());
    for (Encoding encoding : data_.encoding_chain) {
        out.encoding_chain.emplace_back(encoding_name(encoding));
    }
    out.iterations = data_.iteration_count;
    out.max_iterations = data_.max_iterations;
    out.complete = data_.status == SessionStatus::Complete;
    out.status = session_status_name(data_.status);
    out.reason = data_.completion_reason;
    out.history = data_.history;
    out.confidence_scores = data_.confidence_scores;

    out.attempted.reserve(data_.attempted.size());
    for (const auto& [text, encoding] : data_.attempted) {
        out.attempted.push_back(
            AttemptSummary{text.substr(0, ATTEMPT_SNIPPET_LENGTH), std::string(encoding_name(encoding))});
    }
    out.attempted_count = data_.attempted.size();

    return out;
}

Session::Session(std::string original_text, std::size_t max_iterations) {
    data_.original_text = std::move(original_text);
    data_.current_text = data_.original_text;
    data_.history.push_back(data_.original_text);
    data_.max_iterations = max_iterations;
}

bool Session::was_attempted(std::string_view text, Encoding encoding) const {
    return data_.attempted.count(std::make_pair(std::string(text), encoding)) != 0;
}

Error Session::mark_attempted(std::string_view text, Encoding encoding) {
    if (!is_running()) {
        return Error::InvalidState;
    }
    data_.attempted.emplace(std::string(text), encoding);
    return Error::Ok;
}

Error Session::record_decode(Encoding encoding, std::string decoded, double confidence) {
    if (!is_running()) {
        return Error::InvalidState;
    }
    if (encoding == Encoding::None) {
        return Error::InvalidArg;
    }

    data_.attempted.emplace(data_.current_text, encoding);
    data_.encoding_chain.push_back(encoding);
    data_.confidence_scores.push_back(confidence);
    data_.history.push_back(decoded);
    data_.current_text = std::move(decoded);
    ++data_.iteration_count;

    return Error::Ok;
}

Error Session::record_no_progress() {
    if (!is_running()) {
        return Error::InvalidState;
    }

    data_.encoding_chain.push_back(Encoding::None);
    data_.confidence_scores.push_back(0.0);
    data_.history.push_back(data_.current_text);
    ++data_.iteration_count;

    return Error::Ok;
}

Error Session::finish(SessionStatus status, std::string reason) {
    if (status == SessionStatus::Running) {
        return Error::InvalidArg;
    }
    if (!is_running()) {
        return Error::InvalidState;
    }
    data_.status = status;
    data_.completion_reason = std::move(reason);
    return Error::Ok;
}

} // namespace unravel
