// SPDX-License-Identifier: MIT

// tests/result_sink_test.cpp
#include <gtest/gtest.h>

#include <expected>
#include <string>

#include "lib/stream/error.hpp"
#include "lib/stream/result_sink.hpp"

using namespace chunk_pipe;

// A minimal type that should satisfy BasicResultSink
struct MinimalSink {
    void OnError(const Error&) {}
    void Invalidate() {}
};

static_assert(BasicResultSink<MinimalSink>, "MinimalSink must satisfy BasicResultSink");
static_assert(!SingleResultSink<MinimalSink>, "MinimalSink has no OnResult");

// Verify ResultSink satisfies SingleResultSink concept
static_assert(SingleResultSink<ResultSink<std::string>>, "ResultSink<std::string> must satisfy SingleResultSink");
static_assert(SingleResultSink<ResultSink<int>>, "ResultSink<int> must satisfy SingleResultSink");

TEST(ResultSinkConceptTest, MinimalSinkSatisfiesConcept) {
    SUCCEED();  // Compile-time checks above are the real test
}

TEST(ResultSinkTest, DeliversResultToCallback) {
    std::expected<std::string, Error> captured;

    ResultSink<std::string> sink([&](std::expected<std::string, Error> result) {
        captured = std::move(result);
    });

    sink.OnResult("success");

    ASSERT_TRUE(captured.has_value());
    EXPECT_EQ(*captured, "success");
    EXPECT_TRUE(sink.IsDelivered());
}

TEST(ResultSinkTest, DeliversErrorViaOnError) {
    std::expected<std::string, Error> captured;

    ResultSink<std::string> sink([&](std::expected<std::string, Error> result) {
        captured = std::move(result);
    });

    sink.OnError(Error{ErrorCode::PipelineAbort, "cancelled"});

    ASSERT_FALSE(captured.has_value());
    EXPECT_EQ(captured.error().code, ErrorCode::PipelineAbort);
}

TEST(ResultSinkTest, ExactlyOnceDelivery) {
    int call_count = 0;

    ResultSink<int> sink([&](std::expected<int, Error>) {
        ++call_count;
    });

    sink.OnResult(1);
    sink.OnResult(2);  // Should be ignored
    sink.OnError(Error{ErrorCode::InvalidState, "late"});  // Should be ignored

    EXPECT_EQ(call_count, 1);
}

TEST(ResultSinkTest, ErrorFirstWins) {
    int results = 0;
    int errors = 0;

    ResultSink<int> sink([&](std::expected<int, Error> r) {
        r ? ++results : ++errors;
    });

    sink.OnError(Error{ErrorCode::SinkWriteError, "disk full"});
    sink.OnResult(7);

    EXPECT_EQ(results, 0);
    EXPECT_EQ(errors, 1);
}

TEST(ResultSinkTest, InvalidateDropsDelivery) {
    bool called = false;

    ResultSink<int> sink([&](std::expected<int, Error>) { called = true; });
    sink.Invalidate();
    sink.OnResult(1);
    sink.OnError(Error{ErrorCode::PipelineAbort, "late"});

    EXPECT_FALSE(called);
    EXPECT_FALSE(sink.IsDelivered());
}

TEST(ResultSinkTest, SetHandlerBeforeDelivery) {
    int value = 0;

    ResultSink<int> sink;
    sink.SetHandler([&](std::expected<int, Error> r) { value = *r; });
    sink.OnResult(42);

    EXPECT_EQ(value, 42);
}
