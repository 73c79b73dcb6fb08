/**
 * @file submission_tracker.h
 * @brief Lifecycle guard for one signed on-chain submission.
 *
 * Built -> Signed -> Broadcast -> Pending -> {Confirmed | Failed | TimedOut}.
 * A submission may also fail straight from Signed (never accepted) or
 * Broadcast (accepted, then dropped). Exactly one terminal state is reached.
 */

#pragma once

#include <string_view>
#include <vector>

namespace tradegate {

enum class SubmissionState {
    Built,
    Signed,
    Broadcast,
    Pending,
    Confirmed,
    Failed,
    TimedOut
};

std::string_view to_string(SubmissionState state) noexcept;

class SubmissionTracker {
public:
    SubmissionTracker() : history_{SubmissionState::Built} {}

    SubmissionState state() const { return history_.back(); }
    bool is_terminal() const { return is_terminal(state()); }
    const std::vector<SubmissionState>& history() const { return history_; }

    /// @throws std::logic_error on a transition the lifecycle does not allow.
    void advance(SubmissionState next);

    static bool is_terminal(SubmissionState s) {
        return s == SubmissionState::Confirmed || s == SubmissionState::Failed || s == SubmissionState::TimedOut;
    }
    static bool allowed(SubmissionState from, SubmissionState to);

private:
    std::vector<SubmissionState> history_;
};

} // namespace tradegate
