/**
 * @file submission_tracker.cpp
 */

#include "engine/submission_tracker.h"
#include <stdexcept>
#include <string>

namespace tradegate {

std::string_view to_string(SubmissionState state) noexcept {
    switch (state) {
        case SubmissionState::Built: return "built";
        case SubmissionState::Signed: return "signed";
        case SubmissionState::Broadcast: return "broadcast";
        case SubmissionState::Pending: return "pending";
        case SubmissionState::Confirmed: return "confirmed";
        case SubmissionState::Failed: return "failed";
        case SubmissionState::TimedOut: return "timed_out";
    }
    return "unknown";
}

bool SubmissionTracker::allowed(SubmissionState from, SubmissionState to) {
    switch (from) {
        case SubmissionState::Built:
            return to == SubmissionState::Signed;
        case SubmissionState::Signed:
            return to == SubmissionState::Broadcast || to == SubmissionState::Failed;
        case SubmissionState::Broadcast:
            return to == SubmissionState::Pending || to == SubmissionState::Failed;
        case SubmissionState::Pending:
            return to == SubmissionState::Confirmed || to == SubmissionState::Failed ||
                   to == SubmissionState::TimedOut;
        case SubmissionState::Confirmed:
        case SubmissionState::Failed:
        case SubmissionState::TimedOut:
            return false;
    }
    return false;
}

void SubmissionTracker::advance(SubmissionState next) {
    const SubmissionState current = state();
    if (!allowed(current, next)) {
        throw std::logic_error("invalid submission transition " + std::string(to_string(current)) +
                               " -> " + std::string(to_string(next)));
    }
    history_.push_back(next);
}

} // namespace tradegate
