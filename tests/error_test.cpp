// SPDX-License-Identifier: MIT

// tests/error_test.cpp
#include <cerrno>

#include <gtest/gtest.h>

#include "lib/stream/error.hpp"

using namespace chunk_pipe;

TEST(ErrorTest, Construction) {
    Error err{ErrorCode::SinkWriteError, "disk full"};
    EXPECT_EQ(err.code, ErrorCode::SinkWriteError);
    EXPECT_EQ(err.message, "disk full");
    EXPECT_EQ(err.os_errno, 0);
    EXPECT_TRUE(err.stage.empty());
}

TEST(ErrorTest, WithErrnoAndStage) {
    Error err{ErrorCode::SourceReadError, "read() failed", EIO, "source"};
    EXPECT_EQ(err.code, ErrorCode::SourceReadError);
    EXPECT_EQ(err.os_errno, EIO);
    EXPECT_EQ(err.stage, "source");
}

TEST(ErrorTest, CategoryString) {
    // I/O category
    EXPECT_EQ(error_category(ErrorCode::SourceReadError), "io");
    EXPECT_EQ(error_category(ErrorCode::SinkWriteError), "io");

    EXPECT_EQ(error_category(ErrorCode::StageError), "stage");
    EXPECT_EQ(error_category(ErrorCode::PipelineAbort), "cancelled");

    // Protocol category
    EXPECT_EQ(error_category(ErrorCode::ProtocolViolation), "protocol");
    EXPECT_EQ(error_category(ErrorCode::InvalidState), "protocol");

    EXPECT_EQ(error_category(ErrorCode::InvalidConfig), "config");
}

TEST(ErrorTest, CodeName) {
    EXPECT_EQ(error_code_name(ErrorCode::SourceReadError), "SourceReadError");
    EXPECT_EQ(error_code_name(ErrorCode::SinkWriteError), "SinkWriteError");
    EXPECT_EQ(error_code_name(ErrorCode::StageError), "StageError");
    EXPECT_EQ(error_code_name(ErrorCode::PipelineAbort), "PipelineAbort");
    EXPECT_EQ(error_code_name(ErrorCode::ProtocolViolation), "ProtocolViolation");
    EXPECT_EQ(error_code_name(ErrorCode::InvalidState), "InvalidState");
    EXPECT_EQ(error_code_name(ErrorCode::InvalidConfig), "InvalidConfig");
}

static_assert(error_category(ErrorCode::PipelineAbort) == "cancelled",
              "error_category must be usable in constant expressions");
