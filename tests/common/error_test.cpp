// =============================================================================
// remio - Error Handling Tests
// =============================================================================
// Unit tests for error classification, exception formatting and the
// Result helpers.
// =============================================================================

#include "remio/common/error.h"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

namespace remio {
namespace {

// =============================================================================
// Classification Tests
// =============================================================================

TEST(ErrorClassTest, NetworkConditionsAreTransient) {
    EXPECT_EQ(classify(ErrorCode::kTimeout), ErrorClass::kTransient);
    EXPECT_EQ(classify(ErrorCode::kConnectionReset), ErrorClass::kTransient);
    EXPECT_EQ(classify(ErrorCode::kServerError), ErrorClass::kTransient);
    EXPECT_EQ(classify(ErrorCode::kThrottled), ErrorClass::kTransient);
}

TEST(ErrorClassTest, CallerMisuseIsLogical) {
    EXPECT_EQ(classify(ErrorCode::kInvalidArgument), ErrorClass::kLogical);
    EXPECT_EQ(classify(ErrorCode::kInvalidState), ErrorClass::kLogical);
    EXPECT_EQ(classify(ErrorCode::kUnsupported), ErrorClass::kLogical);
}

TEST(ErrorClassTest, EverythingElseIsFatal) {
    EXPECT_EQ(classify(ErrorCode::kNotFound), ErrorClass::kFatal);
    EXPECT_EQ(classify(ErrorCode::kPermissionDenied), ErrorClass::kFatal);
    EXPECT_EQ(classify(ErrorCode::kRetryExhausted), ErrorClass::kFatal);
    EXPECT_EQ(classify(ErrorCode::kFileChanged), ErrorClass::kFatal);
    EXPECT_EQ(classify(ErrorCode::kIOError), ErrorClass::kFatal);
}

TEST(ErrorClassTest, ExitCodesMatchErrorCodes) {
    EXPECT_EQ(toExitCode(ErrorCode::kSuccess), 0);
    EXPECT_EQ(toExitCode(ErrorCode::kNotFound), 4);
    EXPECT_EQ(toExitCode(ErrorCode::kUnsupported), 15);
}

// =============================================================================
// Exception Tests
// =============================================================================

TEST(RemioExceptionTest, WhatIncludesContext) {
    IOError error(ErrorCode::kTimeout, "fetch failed",
                  ErrorContext("s3://bucket/key").withBlock(3).withOffset(12));

    const std::string what = error.what();
    EXPECT_NE(what.find("fetch failed"), std::string::npos);
    EXPECT_NE(what.find("s3://bucket/key"), std::string::npos);
    EXPECT_NE(what.find("12"), std::string::npos);
    EXPECT_EQ(error.code(), ErrorCode::kTimeout);
    ASSERT_TRUE(error.context().has_value());
    EXPECT_EQ(error.context()->blockIndex, 3u);
    EXPECT_EQ(error.context()->byteOffset, 12u);
}

TEST(RemioExceptionTest, AbortFailureDoesNotReplaceCause) {
    UploadAbortedError error(ErrorCode::kServerError, "part 2 failed", ErrorContext("obj"));
    error.setAbortFailure("abort refused");

    EXPECT_EQ(error.code(), ErrorCode::kUploadAborted);
    EXPECT_EQ(error.cause(), ErrorCode::kServerError);
    ASSERT_TRUE(error.abortFailure().has_value());
    EXPECT_EQ(*error.abortFailure(), "abort refused");
    const std::string what = error.what();
    EXPECT_NE(what.find("part 2 failed"), std::string::npos);
    EXPECT_NE(what.find("abort refused"), std::string::npos);
}

TEST(RemioExceptionTest, ThrowExceptionPicksMatchingType) {
    EXPECT_THROW(Error(ErrorCode::kNotFound, "gone").throwException(), NotFoundError);
    EXPECT_THROW(Error(ErrorCode::kInvalidState, "closed").throwException(), LogicalError);
    EXPECT_THROW(Error(ErrorCode::kFileChanged, "etag").throwException(), FileChangedError);
    EXPECT_THROW(Error(ErrorCode::kRetryExhausted, "tired").throwException(), IOError);

    try {
        Error(ErrorCode::kRetryExhausted, "tired").throwException(ErrorContext("obj"));
        FAIL() << "expected IOError";
    } catch (const IOError& e) {
        EXPECT_EQ(e.code(), ErrorCode::kRetryExhausted);
        EXPECT_TRUE(e.hasContext());
    }
}

// =============================================================================
// Result Tests
// =============================================================================

TEST(ResultTest, UnwrapOrThrow) {
    Result<int> good = 7;
    EXPECT_EQ(unwrapOrThrow(good), 7);

    Result<int> bad = makeError(ErrorCode::kInvalidArgument, "nope");
    EXPECT_THROW(unwrapOrThrow(bad), LogicalError);
}

TEST(ResultTest, TryExecuteConvertsExceptions) {
    auto fromRemio = tryExecute([]() -> int { throw NotFoundError("missing"); });
    ASSERT_FALSE(fromRemio.has_value());
    EXPECT_EQ(fromRemio.error().code(), ErrorCode::kNotFound);

    auto fromStd = tryExecute([]() -> int { throw std::runtime_error("boom"); });
    ASSERT_FALSE(fromStd.has_value());
    EXPECT_EQ(fromStd.error().code(), ErrorCode::kIOError);

    auto passThrough = tryExecute([]() { return Result<int>{42}; });
    ASSERT_TRUE(passThrough.has_value());
    EXPECT_EQ(*passThrough, 42);

    auto voidResult = tryExecute([]() {});
    EXPECT_TRUE(voidResult.has_value());
}

}  // namespace
}  // namespace remio
