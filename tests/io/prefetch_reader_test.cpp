// =============================================================================
// remio - Prefetching Reader Tests
// =============================================================================
// Unit tests for the block cache read path: sequential and random access,
// the capacity bound, deferred failures, size discovery and version pinning.
// =============================================================================

#include "remio/io/prefetch_reader.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <limits>
#include <memory>
#include <string>
#include <string_view>

#include "support/scripted_object.h"

namespace remio::io {
namespace {

using test::patternBytes;
using test::ScriptedObject;

// =============================================================================
// Test Fixture
// =============================================================================

class PrefetchReaderTest : public ::testing::Test {
protected:
    void SetUp() override { pool_ = std::make_shared<core::WorkerPool>(4); }

    void TearDown() override { pool_->shutdown(); }

    static ReaderOptions smallOptions(std::size_t blockSize = 4, std::size_t maxBuffer = 8) {
        ReaderOptions options;
        options.blockSize = blockSize;
        options.maxBufferSize = maxBuffer;
        options.retry.maxRetryTimes = 3;
        options.retry.initialDelay = std::chrono::milliseconds{0};
        options.retry.maxDelay = std::chrono::milliseconds{0};
        return options;
    }

    std::unique_ptr<PrefetchReader> open(std::shared_ptr<ScriptedObject> object,
                                         ReaderOptions options = smallOptions()) {
        return std::make_unique<PrefetchReader>(std::move(object), options, pool_);
    }

    static ByteBuffer bytesOf(std::string_view text) {
        return ByteBuffer(text.begin(), text.end());
    }

    std::shared_ptr<core::WorkerPool> pool_;
};

// =============================================================================
// Construction Tests
// =============================================================================

TEST_F(PrefetchReaderTest, RejectsMissingCollaborators) {
    auto object = std::make_shared<ScriptedObject>(patternBytes(8));
    EXPECT_THROW((PrefetchReader{nullptr, smallOptions(), pool_}), LogicalError);
    EXPECT_THROW((PrefetchReader{object, smallOptions(), nullptr}), LogicalError);

    ReaderOptions invalid = smallOptions();
    invalid.blockSize = 0;
    EXPECT_THROW((PrefetchReader{object, invalid, pool_}), LogicalError);
}

TEST_F(PrefetchReaderTest, EmptyObjectReadsNothing) {
    auto object = std::make_shared<ScriptedObject>();
    auto reader = open(object);
    EXPECT_EQ(reader->size(), 0u);
    EXPECT_TRUE(reader->read().empty());
}

TEST_F(PrefetchReaderTest, OpenReportsSizeAndCapacity) {
    auto object = std::make_shared<ScriptedObject>(patternBytes(20));
    auto reader = open(object);
    EXPECT_EQ(reader->knownSize(), std::optional<std::uint64_t>(20));
    EXPECT_EQ(reader->blockCapacity(), 2u);
    EXPECT_EQ(reader->prefetchWindow(), 2u);
    EXPECT_EQ(reader->tell(), 0u);
    EXPECT_EQ(reader->name(), "scripted://object");
}

// =============================================================================
// Sequential Read Tests
// =============================================================================

TEST_F(PrefetchReaderTest, SingleByteReadsStayWithinCapacity) {
    const ByteBuffer content = patternBytes(20);
    auto object = std::make_shared<ScriptedObject>(content);
    auto reader = open(object);

    ByteBuffer collected;
    for (int i = 0; i < 20; ++i) {
        ByteBuffer chunk = reader->read(1);
        ASSERT_EQ(chunk.size(), 1u) << "at byte " << i;
        collected.push_back(chunk[0]);
        EXPECT_LE(reader->residentBlocks(), reader->blockCapacity());
    }

    EXPECT_EQ(collected, content);
    EXPECT_TRUE(reader->read(1).empty());
    EXPECT_EQ(reader->tell(), 20u);
    EXPECT_LE(reader->stats().maxResidentBlocks, 2u);
    EXPECT_EQ(reader->stats().bytesRead, 20u);
    EXPECT_EQ(reader->stats().directReads, 0u);
}

TEST_F(PrefetchReaderTest, EachBlockFetchedOnceWhenReadSequentially) {
    const ByteBuffer content = patternBytes(64);
    auto object = std::make_shared<ScriptedObject>(content);
    auto reader = open(object, smallOptions(8, 32));

    EXPECT_EQ(reader->read(), content);
    for (std::uint64_t offset = 0; offset < 64; offset += 8) {
        EXPECT_EQ(object->fetchCallsAt(offset), 1u) << "offset " << offset;
    }
    EXPECT_LE(object->maxConcurrentFetches(), 4u);
}

TEST_F(PrefetchReaderTest, ReadIntoFillsBuffer) {
    const ByteBuffer content = patternBytes(20);
    auto object = std::make_shared<ScriptedObject>(content);
    auto reader = open(object);

    ByteBuffer buffer(7);
    EXPECT_EQ(reader->readInto(buffer), 7u);
    EXPECT_EQ(buffer, ByteBuffer(content.begin(), content.begin() + 7));

    ByteBuffer rest(32);
    EXPECT_EQ(reader->readInto(rest), 13u);
    EXPECT_TRUE(std::equal(content.begin() + 7, content.end(), rest.begin()));
    EXPECT_EQ(reader->readInto(rest), 0u);
}

TEST_F(PrefetchReaderTest, ReadZeroBytesIsNoop) {
    auto object = std::make_shared<ScriptedObject>(patternBytes(20));
    auto reader = open(object);
    EXPECT_TRUE(reader->read(0).empty());
    EXPECT_EQ(reader->tell(), 0u);
}

TEST_F(PrefetchReaderTest, ReadlineSplitsOnNewlines) {
    auto object = std::make_shared<ScriptedObject>(bytesOf("alpha\nbeta\ngamma"));
    auto reader = open(object);

    EXPECT_EQ(reader->readline(), bytesOf("alpha\n"));
    EXPECT_EQ(reader->readline(3), bytesOf("bet"));
    EXPECT_EQ(reader->readline(), bytesOf("a\n"));
    EXPECT_EQ(reader->readline(), bytesOf("gamma"));
    EXPECT_TRUE(reader->readline().empty());
}

// =============================================================================
// Seek Tests
// =============================================================================

TEST_F(PrefetchReaderTest, SeekClampsToObjectBounds) {
    auto object = std::make_shared<ScriptedObject>(patternBytes(20));
    auto reader = open(object);

    EXPECT_EQ(reader->seek(100), 20u);
    EXPECT_TRUE(reader->read(4).empty());
    EXPECT_EQ(reader->seek(-5, Whence::kEnd), 15u);
    EXPECT_EQ(reader->seek(-100, Whence::kCurrent), 0u);
    EXPECT_EQ(reader->seek(-3), 0u);
    EXPECT_EQ(reader->seek(6, Whence::kCurrent), 6u);
    EXPECT_EQ(reader->tell(), 6u);
}

TEST_F(PrefetchReaderTest, ExtremeSeekOffsetsSaturate) {
    auto object = std::make_shared<ScriptedObject>(patternBytes(20));
    auto reader = open(object);
    constexpr auto kMax = std::numeric_limits<std::int64_t>::max();
    constexpr auto kMin = std::numeric_limits<std::int64_t>::min();

    reader->seek(5);
    EXPECT_EQ(reader->seek(kMax, Whence::kCurrent), 20u);
    EXPECT_EQ(reader->seek(kMax, Whence::kEnd), 20u);
    EXPECT_EQ(reader->seek(kMin, Whence::kEnd), 0u);
    EXPECT_EQ(reader->seek(kMin, Whence::kCurrent), 0u);
}

TEST_F(PrefetchReaderTest, SeekThenReadReturnsRightBytes) {
    const ByteBuffer content = patternBytes(40);
    auto object = std::make_shared<ScriptedObject>(content);
    auto reader = open(object);

    reader->seek(13);
    EXPECT_EQ(reader->read(5), ByteBuffer(content.begin() + 13, content.begin() + 18));
    reader->seek(-10, Whence::kEnd);
    EXPECT_EQ(reader->read(), ByteBuffer(content.begin() + 30, content.end()));
    reader->seek(2);
    EXPECT_EQ(reader->read(3), ByteBuffer(content.begin() + 2, content.begin() + 5));
}

TEST_F(PrefetchReaderTest, RandomSeeksShrinkWindowAndReadDirectly) {
    const ByteBuffer content = patternBytes(40);
    auto object = std::make_shared<ScriptedObject>(content);
    auto reader = open(object);
    EXPECT_EQ(reader->prefetchWindow(), 2u);

    reader->seek(24);
    EXPECT_EQ(reader->prefetchWindow(), 1u);

    EXPECT_EQ(reader->read(3), ByteBuffer(content.begin() + 24, content.begin() + 27));
    EXPECT_EQ(reader->stats().directReads, 1u);
    EXPECT_EQ(reader->residentBlocks(), 0u);
    EXPECT_EQ(reader->tell(), 27u);
}

TEST_F(PrefetchReaderTest, FixedWindowIgnoresSeekPattern) {
    ReaderOptions options = smallOptions(4, 16);
    options.prefetchWindow = 3;
    auto object = std::make_shared<ScriptedObject>(patternBytes(40));
    auto reader = open(object, options);

    EXPECT_EQ(reader->prefetchWindow(), 3u);
    reader->seek(24);
    reader->seek(4);
    EXPECT_EQ(reader->prefetchWindow(), 3u);
}

// =============================================================================
// Failure Tests
// =============================================================================

TEST_F(PrefetchReaderTest, FailedBlockRaisesOnlyWhenConsumed) {
    const ByteBuffer content = patternBytes(20);
    auto object = std::make_shared<ScriptedObject>(content);
    object->failRangeAt(8, ErrorCode::kNotFound, 1);
    auto reader = open(object);

    // Blocks 0 and 1 are served although block 2 already failed in the background
    EXPECT_EQ(reader->read(8), ByteBuffer(content.begin(), content.begin() + 8));

    try {
        (void)reader->read(4);
        FAIL() << "expected NotFoundError";
    } catch (const NotFoundError& error) {
        ASSERT_TRUE(error.context().has_value());
        EXPECT_EQ(error.context()->byteOffset, 8u);
        EXPECT_EQ(error.context()->blockIndex, 2u);
    }
    EXPECT_EQ(reader->tell(), 8u);

    // The failed slot was dropped, so the next read fetches again
    EXPECT_EQ(reader->read(), ByteBuffer(content.begin() + 8, content.end()));
    EXPECT_EQ(object->fetchCallsAt(8), 2u);
}

TEST_F(PrefetchReaderTest, FailureMidReadLeavesCursor) {
    const ByteBuffer content = patternBytes(20);
    auto object = std::make_shared<ScriptedObject>(content);
    object->failRangeAt(8, ErrorCode::kPermissionDenied);
    auto reader = open(object);

    try {
        (void)reader->read(12);
        FAIL() << "expected an I/O failure";
    } catch (const RemioException& error) {
        EXPECT_EQ(error.code(), ErrorCode::kPermissionDenied);
        ASSERT_TRUE(error.context().has_value());
        EXPECT_EQ(error.context()->byteOffset, 8u);
    }
    EXPECT_EQ(reader->tell(), 0u);
}

TEST_F(PrefetchReaderTest, TransientFailuresAreRetried) {
    const ByteBuffer content = patternBytes(20);
    auto object = std::make_shared<ScriptedObject>(content);
    object->failRangeAt(4, ErrorCode::kTimeout, 2);
    auto reader = open(object);

    EXPECT_EQ(reader->read(), content);
    EXPECT_EQ(object->fetchCallsAt(4), 3u);
}

TEST_F(PrefetchReaderTest, PersistentTransientFailureExhaustsRetries) {
    auto object = std::make_shared<ScriptedObject>(patternBytes(20));
    object->failRangeAt(0, ErrorCode::kServerError);
    auto reader = open(object);

    try {
        (void)reader->read(2);
        FAIL() << "expected retry exhaustion";
    } catch (const IOError& error) {
        EXPECT_EQ(error.code(), ErrorCode::kRetryExhausted);
    }
    EXPECT_EQ(object->fetchCallsAt(0), 3u);
}

TEST_F(PrefetchReaderTest, CloseWithFailingPrefetchesDoesNotWait) {
    ReaderOptions options = smallOptions();
    options.retry.maxRetryTimes = 5;
    options.retry.initialDelay = std::chrono::milliseconds{10'000};
    options.retry.maxDelay = std::chrono::milliseconds{60'000};

    auto object = std::make_shared<ScriptedObject>(patternBytes(20));
    object->failRangeAt(4, ErrorCode::kThrottled);
    auto reader = open(object, options);

    EXPECT_EQ(reader->read(1).size(), 1u);

    const auto start = std::chrono::steady_clock::now();
    EXPECT_NO_THROW(reader->close());
    pool_->waitIdle();
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds{5});
    EXPECT_TRUE(reader->closed());
}

TEST_F(PrefetchReaderTest, VersionChangeIsDetected) {
    auto object = std::make_shared<ScriptedObject>(patternBytes(20));
    object->setVersion("v1");
    auto reader = open(object);

    EXPECT_EQ(reader->read(4).size(), 4u);
    object->setVersion("v2");
    EXPECT_THROW((void)reader->read(), FileChangedError);
}

TEST_F(PrefetchReaderTest, OperationsAfterCloseThrow) {
    auto object = std::make_shared<ScriptedObject>(patternBytes(20));
    auto reader = open(object);
    reader->close();
    reader->close();

    EXPECT_THROW((void)reader->read(1), LogicalError);
    EXPECT_THROW((void)reader->readline(), LogicalError);
    EXPECT_THROW(reader->seek(0), LogicalError);
    EXPECT_EQ(reader->residentBlocks(), 0u);
}

// =============================================================================
// Size Discovery Tests
// =============================================================================

TEST_F(PrefetchReaderTest, UnknownSizeLearnedFromShortBlock) {
    const ByteBuffer content = patternBytes(18);
    auto object = std::make_shared<ScriptedObject>(content);
    object->setReportSize(false);
    auto reader = open(object);

    EXPECT_FALSE(reader->knownSize().has_value());
    EXPECT_THROW(reader->seek(0, Whence::kEnd), LogicalError);

    EXPECT_EQ(reader->read(), content);
    EXPECT_EQ(reader->knownSize(), std::optional<std::uint64_t>(18));
    EXPECT_EQ(reader->seek(-2, Whence::kEnd), 16u);
}

TEST_F(PrefetchReaderTest, UnknownSizeAlignedToBlocks) {
    const ByteBuffer content = patternBytes(16);
    auto object = std::make_shared<ScriptedObject>(content);
    object->setReportSize(false);
    auto reader = open(object);

    EXPECT_EQ(reader->read(), content);
    EXPECT_TRUE(reader->read(4).empty());
}

TEST_F(PrefetchReaderTest, HugeReadOnUnknownSizeReturnsObject) {
    const ByteBuffer content = patternBytes(20);
    auto object = std::make_shared<ScriptedObject>(content);
    object->setReportSize(false);
    auto reader = open(object, smallOptions(4, 16));

    EXPECT_EQ(reader->read(std::size_t{1} << 62), content);
    EXPECT_EQ(reader->tell(), 20u);
    EXPECT_TRUE(reader->read(std::size_t{1} << 62).empty());
}

TEST_F(PrefetchReaderTest, SizeQueriedOnceAtOpen) {
    auto object = std::make_shared<ScriptedObject>(patternBytes(20));
    auto reader = open(object);
    EXPECT_EQ(object->sizeCalls(), 1u);
    EXPECT_EQ(reader->size(), 20u);
    EXPECT_EQ(object->sizeCalls(), 1u);
}

// =============================================================================
// Private Pool Tests
// =============================================================================

TEST(PrefetchReaderPrivatePoolTest, OwnsItsPool) {
    EngineConfig config;
    config.workerCount = 2;
    config.reader.blockSize = 3;
    config.reader.maxBufferSize = 9;

    const ByteBuffer content = patternBytes(50);
    PrefetchReader reader(std::make_shared<ScriptedObject>(content), config);
    EXPECT_EQ(reader.read(), content);
}

}  // namespace
}  // namespace remio::io
