#include <gtest/gtest.h>

#include "executor/exit_status.hpp"

namespace {

using runbox::executor::ClassifyExitCode;
using runbox::executor::Status;

TEST(ExitStatusTest, KnownTerminations) {
    EXPECT_EQ(ClassifyExitCode(137), Status::kMemoryLimitExceeded);
    EXPECT_EQ(ClassifyExitCode(124), Status::kTimeLimitExceeded);
    EXPECT_EQ(ClassifyExitCode(1), Status::kRuntimeError);
}

TEST(ExitStatusTest, EverythingElseIsOk) {
    for (const int code : {0, 2, 3, 123, 125, 126, 127, 136, 138, 139, 255, -1}) {
        EXPECT_EQ(ClassifyExitCode(code), Status::kOk) << "exit code " << code;
    }
}

TEST(ExitStatusTest, WireNames) {
    EXPECT_STREQ(ToString(Status::kOk), "OK");
    EXPECT_STREQ(ToString(Status::kMemoryLimitExceeded), "MLE");
    EXPECT_STREQ(ToString(Status::kTimeLimitExceeded), "TLE");
    EXPECT_STREQ(ToString(Status::kRuntimeError), "RTE");
    EXPECT_STREQ(ToString(Status::kWrongAnswer), "WA");
    EXPECT_EQ(runbox::executor::StatusFromString("TLE"), Status::kTimeLimitExceeded);
    EXPECT_FALSE(runbox::executor::StatusFromString("tle").has_value());
}

}  // namespace
