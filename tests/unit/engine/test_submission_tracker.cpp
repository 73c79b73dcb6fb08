/**
 * @file test_submission_tracker.cpp
 */

#include <gtest/gtest.h>
#include "engine/submission_tracker.h"

#include <stdexcept>

using namespace tradegate;

TEST(SubmissionTracker, HappyPath) {
    SubmissionTracker tracker;
    EXPECT_EQ(tracker.state(), SubmissionState::Built);
    tracker.advance(SubmissionState::Signed);
    tracker.advance(SubmissionState::Broadcast);
    tracker.advance(SubmissionState::Pending);
    tracker.advance(SubmissionState::Confirmed);
    EXPECT_TRUE(tracker.is_terminal());
    EXPECT_EQ(tracker.history().size(), 5u);
}

TEST(SubmissionTracker, FailsFromSignedOrBroadcast) {
    SubmissionTracker never_accepted;
    never_accepted.advance(SubmissionState::Signed);
    never_accepted.advance(SubmissionState::Failed);
    EXPECT_EQ(never_accepted.state(), SubmissionState::Failed);

    SubmissionTracker dropped;
    dropped.advance(SubmissionState::Signed);
    dropped.advance(SubmissionState::Broadcast);
    dropped.advance(SubmissionState::Failed);
    EXPECT_TRUE(dropped.is_terminal());
}

TEST(SubmissionTracker, SecondTerminalStateThrows) {
    SubmissionTracker tracker;
    tracker.advance(SubmissionState::Signed);
    tracker.advance(SubmissionState::Broadcast);
    tracker.advance(SubmissionState::Pending);
    tracker.advance(SubmissionState::TimedOut);
    EXPECT_THROW(tracker.advance(SubmissionState::Confirmed), std::logic_error);
    EXPECT_THROW(tracker.advance(SubmissionState::Failed), std::logic_error);
    EXPECT_EQ(tracker.state(), SubmissionState::TimedOut);
}

TEST(SubmissionTracker, SkippingStatesThrows) {
    SubmissionTracker tracker;
    EXPECT_THROW(tracker.advance(SubmissionState::Broadcast), std::logic_error);
    EXPECT_THROW(tracker.advance(SubmissionState::Confirmed), std::logic_error);
    tracker.advance(SubmissionState::Signed);
    EXPECT_THROW(tracker.advance(SubmissionState::TimedOut), std::logic_error);
    EXPECT_EQ(to_string(SubmissionState::TimedOut), "timed_out");
}
