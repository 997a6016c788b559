#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "compaction/duplicate_detector.hpp"
#include "core/errors/compaction_errors.hpp"

namespace {

using logcompact::compaction::DuplicateDetector;
using logcompact::core::errors::ErrorCategory;
using logcompact::core::errors::get_error;
using logcompact::core::errors::get_value;
using logcompact::core::errors::is_error;
using logcompact::protocol::Message;
using logcompact::protocol::Role;

Message make(Role role, const std::string& content) {
    Message m;
    m.role = role;
    m.content = content;
    return m;
}

DuplicateDetector detector(int window) {
    auto created = DuplicateDetector::create(window);
    EXPECT_FALSE(is_error(created));
    return get_value(created);
}

TEST(DuplicateDetectorTest, RejectsNonPositiveWindow) {
    for (int window : {0, -1}) {
        auto created = DuplicateDetector::create(window);
        ASSERT_TRUE(is_error(created));
        EXPECT_EQ(get_error(created).category, ErrorCategory::Configuration);
        EXPECT_EQ(get_error(created).code, "invalid_window_size");
    }
}

TEST(DuplicateDetectorTest, EmptyAndSingleMessageLogsAreNoOps) {
    const auto d = detector(3);
    EXPECT_TRUE(d.mark({}).empty());
    EXPECT_EQ(d.mark({make(Role::Assistant, "ok")}), std::vector<bool>{false});
}

TEST(DuplicateDetectorTest, DropsRepeatsAfterFirstOccurrence) {
    const auto d = detector(3);
    const std::vector<Message> log = {make(Role::Assistant, "ok"),
                                      make(Role::Assistant, "ok"),
                                      make(Role::Assistant, "ok")};
    EXPECT_EQ(d.mark(log), (std::vector<bool>{false, true, true}));
}

TEST(DuplicateDetectorTest, NeverDropsUserTurns) {
    const auto d = detector(3);
    const std::vector<Message> log = {make(Role::User, "hi"), make(Role::User, "hi")};
    EXPECT_EQ(d.mark(log), (std::vector<bool>{false, false}));
}

TEST(DuplicateDetectorTest, DedupsToolResultsAndSystemNotes) {
    const auto d = detector(3);
    const std::vector<Message> log = {make(Role::Tool, "stdout: 1"),
                                      make(Role::Tool, "stdout: 1"),
                                      make(Role::System, "note"),
                                      make(Role::System, "note")};
    EXPECT_EQ(d.mark(log), (std::vector<bool>{false, true, false, true}));
}

TEST(DuplicateDetectorTest, RepeatOutsideWindowIsKept) {
    const auto d = detector(2);
    const std::vector<Message> log = {make(Role::Assistant, "ok"),
                                      make(Role::User, "a"),
                                      make(Role::User, "b"),
                                      make(Role::Assistant, "ok")};
    EXPECT_EQ(d.mark(log), (std::vector<bool>{false, false, false, false}));
}

TEST(DuplicateDetectorTest, WindowCountsRetainedMessagesOnly) {
    // The dropped copies do not push the original out of a window of 2.
    const auto d = detector(2);
    const std::vector<Message> log = {make(Role::Assistant, "ok"),
                                      make(Role::Assistant, "ok"),
                                      make(Role::Assistant, "ok"),
                                      make(Role::User, "q"),
                                      make(Role::Assistant, "ok")};
    EXPECT_EQ(d.mark(log), (std::vector<bool>{false, true, true, false, true}));
}

TEST(DuplicateDetectorTest, DifferentRolesWithSameContentAreDistinct) {
    const auto d = detector(3);
    const std::vector<Message> log = {make(Role::Assistant, "done"),
                                      make(Role::Tool, "done")};
    EXPECT_EQ(d.mark(log), (std::vector<bool>{false, false}));
}

}  // namespace
