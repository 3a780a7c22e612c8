/**
 * @file test_sanitize.cpp
 * @brief Unit tests for error-message and job-id redaction.
 */

#include "core/sanitize.hpp"

#include <gtest/gtest.h>

using namespace jobtier;

TEST(SanitizeErrorTest, RedactsAbsolutePaths) {
    EXPECT_EQ(sanitize_error_message("Cannot open /var/lib/jobtier/secret.conf: denied"),
              "Cannot open [path]: denied");
    EXPECT_EQ(sanitize_error_message("at /home/build/src/job.cpp:42"), "at [path]:42");
    EXPECT_EQ(sanitize_error_message("/etc/passwd"), "[path]");
}

TEST(SanitizeErrorTest, RedactsEveryPath) {
    EXPECT_EQ(sanitize_error_message("copy /tmp/a.txt to /srv/data/b.txt failed"),
              "copy [path] to [path] failed");
}

TEST(SanitizeErrorTest, LeavesFractionsAndLoneSlashes) {
    EXPECT_EQ(sanitize_error_message("progress 1/2"), "progress 1/2");
    EXPECT_EQ(sanitize_error_message("a / b"), "a / b");
    EXPECT_EQ(sanitize_error_message("read/write error"), "read/write error");
}

TEST(SanitizeErrorTest, FlattensWhitespaceAndDropsControl) {
    EXPECT_EQ(sanitize_error_message("line one\nline two\tend\n"), "line one line two end");
    EXPECT_EQ(sanitize_error_message(std::string{"bell\x07here"}), "bellhere");
}

TEST(SanitizeErrorTest, TruncatesWithEllipsis) {
    std::string long_message(600, 'x');
    auto out = sanitize_error_message(long_message);
    EXPECT_EQ(out.size(), kMaxErrorMessageLength);
    EXPECT_EQ(out.substr(out.size() - 3), "...");

    EXPECT_EQ(sanitize_error_message("abcdefghij", 8), "abcde...");
    EXPECT_EQ(sanitize_error_message("abcdefghij", 3), "abc");
}

TEST(SanitizeErrorTest, ShortMessageUntouched) {
    EXPECT_EQ(sanitize_error_message("plain failure"), "plain failure");
    EXPECT_EQ(sanitize_error_message(""), "");
}

TEST(SanitizeJobIdTest, KeepsSafeCharacters) {
    EXPECT_EQ(sanitize_job_id("job-1_a.b"), "job-1_a.b");
    EXPECT_EQ(sanitize_job_id("abc/../x; rm -rf"), "abc..xrm-rf");
    EXPECT_EQ(sanitize_job_id("id\nwith\nnewlines"), "idwithnewlines");
}
