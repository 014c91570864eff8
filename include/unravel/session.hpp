/**
 * @file session.hpp
 * @brief Record of one decoding run.
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
 * A Session is the mutable builder owned by the Controller for the
 * duration of one decode call. Its history is append-only and the only
 * way to read it from outside is through a SessionSnapshot.
 *
 * Invariants:
 * - history().size() == iteration_count() + 1, history()[0] == original
 * - encoding_chain().size() == confidence_scores().size() == iteration_count()
 * - once status() != Running every mutator returns Error::InvalidState
 */

#ifndef UNRAVEL_SESSION_HPP
#define UNRAVEL_SESSION_HPP

#include "encoding.hpp"
#include "error.hpp"

#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace unravel {

enum class SessionStatus : std::uint8_t {
    Running,
    Complete,
    Failed,
    StoppedMaxIter,
    StoppedLoop
};

const char* session_status_name(SessionStatus status) noexcept;

/**
 * @brief Which cycle pattern a history exhibits.
 */
enum class LoopKind : std::uint8_t {
    None,
    Oscillation, ///< history[-1] == history[-3] and history[-2] == history[-4]
    NoChange,    ///< history[-1] == history[-2]
    ExactRepeat  ///< history[-1] occurs earlier in the history
};

const char* loop_kind_name(LoopKind kind) noexcept;

/**
 * @brief Detect a decoding cycle in a text history.
 *
 * Only period-2 oscillation is recognised; longer cycles surface as an
 * exact repeat once the newest text reappears.
 */
LoopKind detect_loop(const std::vector<std::string>& history) noexcept;

/**
 * @brief Bounded description of one attempted (text, decoder) pair.
 */
struct AttemptSummary {
    std::string text_snippet; ///< First ATTEMPT_SNIPPET_LENGTH characters
    std::string decoder;
};

/**
 * @brief Serializable projection of a session.
 */
struct SessionExport {
    std::string original_text;
    std::string final_text;
    std::vector<std::string> encoding_chain;
    std::size_t iterations = 0;
    std::size_t max_iterations = 0;
    bool complete = false;
    std::string status;
    std::string reason;
    std::vector<std::string> history;
    std::vector<double> confidence_scores;
    std::vector<AttemptSummary> attempted;
    std::size_t attempted_count = 0;
};

namespace detail {

struct SessionData {
    std::string original_text;
    std::string current_text;
    std::vector<std::string> history;
    std::vector<Encoding> encoding_chain;
    std::vector<double> confidence_scores;
    std::set<std::pair<std::string, Encoding>> attempted;
    std::size_t iteration_count = 0;
    std::size_t max_iterations = 0;
    SessionStatus status = SessionStatus::Running;
    std::string completion_reason;
};

} // namespace detail

/**
 * @brief Immutable copy of a session, returned to callers.
 */
class SessionSnapshot {
public:
    const std::string& original_text() const noexcept { return data_.original_text; }
    const std::string& current_text() const noexcept { return data_.current_text; }
    const std::vector<std::string>& history() const noexcept { return data_.history; }
    const std::vector<Encoding>& encoding_chain() const noexcept { return data_.encoding_chain; }
    const std::vector<double>& confidence_scores() const noexcept { return data_.confidence_scores; }
    std::size_t iteration_count() const noexcept { return data_.iteration_count; }
    std::size_t max_iterations() const noexcept { return data_.max_iterations; }
    SessionStatus status() const noexcept { return data_.status; }
    const std::string& completion_reason() const noexcept { return data_.completion_reason; }
    std::size_t attempted_count() const noexcept { return data_.attempted.size(); }

    bool is_complete() const noexcept { return data_.status == SessionStatus::Complete; }

    /**
     * @brief Project the snapshot into a serializable record.
     *
     * The full history is kept; attempted pairs are reduced to text
     * snippets.
     */
    SessionExport export_record() const;

private:
    friend class Session;
    explicit SessionSnapshot(detail::SessionData data) : data_(std::move(data)) {}

    detail::SessionData data_;
};

/**
 * @brief Mutable record of one run. Owned by exactly one Controller call.
 */
class Session {
public:
    /**
     * @brief Start a session.
     *
     * @param original_text Input text, becomes history()[0]
     * @param max_iterations Iteration cap (> 0)
     */
    Session(std::string original_text, std::size_t max_iterations);

    const std::string& original_text() const noexcept { return data_.original_text; }
    const std::string& current_text() const noexcept { return data_.current_text; }
    const std::vector<std::string>& history() const noexcept { return data_.history; }
    const std::vector<Encoding>& encoding_chain() const noexcept { return data_.encoding_chain; }
    const std::vector<double>& confidence_scores() const noexcept { return data_.confidence_scores; }
    std::size_t iteration_count() const noexcept { return data_.iteration_count; }
    std::size_t max_iterations() const noexcept { return data_.max_iterations; }
    SessionStatus status() const noexcept { return data_.status; }
    const std::string& completion_reason() const noexcept { return data_.completion_reason; }

    bool is_running() const noexcept { return data_.status == SessionStatus::Running; }

    /// True once iteration_count() has reached max_iterations().
    bool iteration_limit_reached() const noexcept {
        return data_.iteration_count >= data_.max_iterations;
    }

    /// True if @p encoding was already tried on @p text.
    bool was_attempted(std::string_view text, Encoding encoding) const;

    /**
     * @brief Remember that @p encoding was tried on @p text.
     * @return Error::InvalidState once the session is frozen
     */
    Error mark_attempted(std::string_view text, Encoding encoding);

    /**
     * @brief Append a decode step.
     *
     * Appends @p decoded to the history, @p encoding to the chain and
     * @p confidence to the scores, advances the iteration counter and
     * makes @p decoded the current text.
     *
     * @return Error::InvalidState once the session is frozen,
     *         Error::InvalidArg for Encoding::None
     */
    Error record_decode(Encoding encoding, std::string decoded, double confidence);

    /**
     * @brief Append an iteration in which no decoder made progress.
     *
     * The current text is repeated in the history and Encoding::None is
     * recorded with confidence 0.0 so the length invariants keep holding.
     */
    Error record_no_progress();

    /// Loop check over the current history.
    LoopKind detect_loop() const noexcept {
        return unravel::detect_loop(data_.history);
    }

    /**
     * @brief Move to a terminal status and freeze the session.
     *
     * @return Error::InvalidArg if @p status is Running,
     *         Error::InvalidState if already frozen
     */
    Error finish(SessionStatus status, std::string reason);

    SessionSnapshot snapshot() const {
        return SessionSnapshot(data_);
    }

private:
    detail::SessionData data_;
};

} // namespace unravel

#endif // UNRAVEL_SESSION_HPP
