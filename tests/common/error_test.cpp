// =============================================================================
// sendstream-upgrade - Error Handling Tests
// =============================================================================

#include "ssu/common/error.h"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

namespace ssu {
namespace {

TEST(ErrorContextTest, FormatsEveryField) {
    ErrorContext ctx;
    ctx.withStage("construct-0").withFile("in.stream").withCommand(12).withOffset(0x40);

    const std::string text = ctx.format();
    EXPECT_NE(text.find("stage: construct-0"), std::string::npos);
    EXPECT_NE(text.find("file: in.stream"), std::string::npos);
    EXPECT_NE(text.find("command: 12"), std::string::npos);
    EXPECT_NE(text.find("offset: 0x40"), std::string::npos);
}

TEST(ErrorContextTest, EmptyContextFormatsToNothing) {
    EXPECT_TRUE(ErrorContext().format().empty());
}

TEST(SSUExceptionTest, WhatCarriesCodeMessageAndContext) {
    const ProtocolError error("Bad stream magic", ErrorContext().withOffset(0));
    const std::string what = error.what();

    EXPECT_EQ(error.code(), ErrorCode::kProtocolError);
    EXPECT_EQ(error.message(), "Bad stream magic");
    EXPECT_NE(what.find("Bad stream magic"), std::string::npos);
    EXPECT_NE(what.find("offset: 0x0"), std::string::npos);
    EXPECT_NE(what.find(std::string(errorCodeToString(ErrorCode::kProtocolError))),
              std::string::npos);
}

TEST(SSUExceptionTest, ExitCodeMatchesErrorCode) {
    EXPECT_EQ(ChecksumError("x").exitCode(), toExitCode(ErrorCode::kChecksumError));
    EXPECT_EQ(UnexpectedEofError("x").exitCode(), toExitCode(ErrorCode::kUnexpectedEof));
    EXPECT_EQ(WorkerFault("x").exitCode(), toExitCode(ErrorCode::kWorkerFault));
    EXPECT_EQ(toExitCode(ErrorCode::kSuccess), 0);
}

TEST(SSUExceptionTest, OnlySuccessCodeIsSuccess) {
    EXPECT_TRUE(isSuccess(ErrorCode::kSuccess));
    EXPECT_FALSE(isSuccess(ErrorCode::kCancelled));
    EXPECT_FALSE(isSuccess(ChecksumError("x").code()));
}

TEST(ResultTest, ErrorKeepsContextInMessage) {
    const IOError io("Failed to read from source", ErrorContext("in.stream"));
    const Error error(io);

    EXPECT_EQ(error.code(), ErrorCode::kIOError);
    EXPECT_NE(error.message().find("in.stream"), std::string::npos);
    EXPECT_FALSE(error.isCancellation());
    EXPECT_TRUE(Error(ErrorCode::kCancelled, "queue was aborted").isCancellation());
}

TEST(ResultTest, ThrowExceptionRestoresType) {
    const Error error(ErrorCode::kUnexpectedEof, "Source ended");
    EXPECT_THROW(error.throwException(), UnexpectedEofError);

    const Error cancelled(ErrorCode::kCancelled, "queue was aborted");
    try {
        cancelled.throwException();
        FAIL() << "expected an exception";
    } catch (const SSUException& e) {
        EXPECT_EQ(e.code(), ErrorCode::kCancelled);
    }
}

TEST(ResultTest, TryExecuteConvertsExceptions) {
    auto ok = tryExecute([] { return 7; });
    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ(*ok, 7);

    auto protocol = tryExecute([] { throw ProtocolError("malformed"); });
    ASSERT_FALSE(protocol.has_value());
    EXPECT_EQ(protocol.error().code(), ErrorCode::kProtocolError);

    auto foreign = tryExecute([]() -> int { throw std::runtime_error("boom"); });
    ASSERT_FALSE(foreign.has_value());
    EXPECT_EQ(foreign.error().code(), ErrorCode::kWorkerFault);
    EXPECT_EQ(foreign.error().message(), "boom");
}

TEST(ResultTest, UnwrapOrThrow) {
    EXPECT_EQ(unwrapOrThrow(makeSuccess(3)), 3);
    EXPECT_THROW(unwrapOrThrow(makeError<int>(ErrorCode::kChecksumError, "bad crc")),
                 ChecksumError);
    EXPECT_NO_THROW(unwrapOrThrow(makeVoidSuccess()));
    EXPECT_THROW(unwrapOrThrow(makeVoidError(ErrorCode::kConfigurationError, "conflict")),
                 ConfigurationError);
}

}  // namespace
}  // namespace ssu
