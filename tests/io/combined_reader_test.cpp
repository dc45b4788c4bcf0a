// =============================================================================
// remio - Combined Reader Tests
// =============================================================================

#include "remio/io/combined_reader.h"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <limits>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "support/scripted_object.h"

namespace remio::io {
namespace {

using test::ScriptedObject;

class CombinedReaderTest : public ::testing::Test {
protected:
    void SetUp() override { pool_ = std::make_shared<core::WorkerPool>(2); }

    std::unique_ptr<PrefetchReader> member(std::string_view text, std::string name) {
        auto object = std::make_shared<ScriptedObject>(ByteBuffer(text.begin(), text.end()),
                                                       std::move(name));
        objects_.push_back(object);

        ReaderOptions options;
        options.blockSize = 3;
        options.maxBufferSize = 9;
        options.retry.initialDelay = std::chrono::milliseconds{0};
        return std::make_unique<PrefetchReader>(object, options, pool_);
    }

    /// @brief Members "hello " + "" + "wide\nwor" + "ld\n".
    std::unique_ptr<CombinedReader> combined() {
        std::vector<std::unique_ptr<PrefetchReader>> readers;
        readers.push_back(member("hello ", "mem://a"));
        readers.push_back(member("", "mem://empty"));
        readers.push_back(member("wide\nwor", "mem://b"));
        readers.push_back(member("ld\n", "mem://c"));
        return std::make_unique<CombinedReader>(std::move(readers), "combined");
    }

    static std::string text(const ByteBuffer& bytes) { return std::string(bytes.begin(), bytes.end()); }

    std::shared_ptr<core::WorkerPool> pool_;
    std::vector<std::shared_ptr<ScriptedObject>> objects_;
};

TEST_F(CombinedReaderTest, SizeIsSumOfMembers) {
    auto reader = combined();
    EXPECT_EQ(reader->size(), 17u);
    EXPECT_EQ(reader->name(), "combined");
    EXPECT_EQ(reader->tell(), 0u);
}

TEST_F(CombinedReaderTest, ReadsAcrossMembers) {
    auto reader = combined();
    EXPECT_EQ(text(reader->read(4)), "hell");
    EXPECT_EQ(text(reader->read(5)), "o wid");
    EXPECT_EQ(text(reader->read()), "e\nworld\n");
    EXPECT_TRUE(reader->read(1).empty());
    EXPECT_EQ(reader->tell(), 17u);
}

TEST_F(CombinedReaderTest, ReadlineCrossesBoundaries) {
    auto reader = combined();
    EXPECT_EQ(text(reader->readline()), "hello wide\n");
    EXPECT_EQ(text(reader->readline()), "world\n");
    EXPECT_TRUE(reader->readline().empty());
}

TEST_F(CombinedReaderTest, ReadlineHonoursLimit) {
    auto reader = combined();
    EXPECT_EQ(text(reader->readline(8)), "hello wi");
    EXPECT_EQ(text(reader->readline()), "de\n");
}

TEST_F(CombinedReaderTest, SeekRoutesToMember) {
    auto reader = combined();
    EXPECT_EQ(reader->seek(6), 6u);
    EXPECT_EQ(text(reader->read(4)), "wide");
    EXPECT_EQ(reader->seek(-3, Whence::kEnd), 14u);
    EXPECT_EQ(text(reader->read()), "ld\n");
    EXPECT_EQ(reader->seek(-9, Whence::kCurrent), 8u);
    EXPECT_EQ(text(reader->read(2)), "de");
}

TEST_F(CombinedReaderTest, SeekPastEndReadsNothing) {
    auto reader = combined();
    EXPECT_EQ(reader->seek(100), 100u);
    EXPECT_TRUE(reader->read().empty());
    EXPECT_TRUE(reader->readline().empty());
}

TEST_F(CombinedReaderTest, NegativeSeekThrows) {
    auto reader = combined();
    reader->seek(5);
    EXPECT_THROW(reader->seek(-1), LogicalError);
    EXPECT_THROW(reader->seek(-6, Whence::kCurrent), LogicalError);
    EXPECT_EQ(reader->tell(), 5u);
}

TEST_F(CombinedReaderTest, ExtremeSeekOffsetsSaturate) {
    auto reader = combined();
    constexpr auto kMax = std::numeric_limits<std::int64_t>::max();
    constexpr auto kMin = std::numeric_limits<std::int64_t>::min();

    reader->seek(5);
    EXPECT_EQ(reader->seek(kMax, Whence::kEnd), static_cast<std::uint64_t>(kMax));
    EXPECT_TRUE(reader->read().empty());
    EXPECT_EQ(reader->seek(1, Whence::kCurrent), static_cast<std::uint64_t>(kMax));
    EXPECT_THROW(reader->seek(kMin, Whence::kEnd), LogicalError);
    EXPECT_EQ(reader->tell(), static_cast<std::uint64_t>(kMax));
}

TEST_F(CombinedReaderTest, CloseClosesMembers) {
    auto reader = combined();
    reader->close();
    EXPECT_TRUE(reader->closed());
    EXPECT_THROW((void)reader->read(), LogicalError);
    reader->close();
}

TEST_F(CombinedReaderTest, RejectsNullMember) {
    std::vector<std::unique_ptr<PrefetchReader>> readers;
    readers.push_back(member("abc", "mem://a"));
    readers.push_back(nullptr);
    EXPECT_THROW((CombinedReader{std::move(readers), "broken"}), LogicalError);
}

TEST_F(CombinedReaderTest, NoMembersIsEmpty) {
    CombinedReader reader({}, "nothing");
    EXPECT_EQ(reader.size(), 0u);
    EXPECT_TRUE(reader.read().empty());
}

}  // namespace
}  // namespace remio::io
