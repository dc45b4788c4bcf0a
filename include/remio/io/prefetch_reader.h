// =============================================================================
// remio - Prefetching Reader (read path)
// =============================================================================
// Presents a remote object as a seekable byte stream backed by a bounded
// block cache.
//
// The object is split into blocks of ReaderOptions::blockSize bytes. Each
// read makes sure the block under the cursor is fetched (the caller waits for
// it) and schedules fetches for the following blocks of the prefetch window
// on the worker pool. Fetched and in-flight blocks together never exceed
// blockCapacity() = maxBufferSize / blockSize (at least one) blocks.
//
// Eviction only removes fetched blocks outside the current window: blocks
// behind the cursor first (lowest index first), then the least recently used.
// In-flight fetches are never dropped; their results stay cached so a later
// seek back can reuse them.
//
// A block that fails after retries only raises when a read needs it. The
// failed slot is then dropped so the next read of that range fetches again.
//
// Thread safety: a reader belongs to one caller thread. Only the fetch tasks
// run on the pool, and they touch no reader state.
// =============================================================================

#ifndef REMIO_IO_PREFETCH_READER_H
#define REMIO_IO_PREFETCH_READER_H

#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "remio/common/config.h"
#include "remio/common/error.h"
#include "remio/common/types.h"
#include "remio/core/backend.h"
#include "remio/core/retry_policy.h"
#include "remio/core/worker_pool.h"

namespace remio::io {

// =============================================================================
// Reader Statistics
// =============================================================================

/// @brief Counters describing cache behaviour of one reader.
struct ReaderStats {
    /// @brief Block fetches submitted to the pool.
    std::uint64_t blocksFetched = 0;

    /// @brief Reads of a block that was already cached or in flight.
    std::uint64_t cacheHits = 0;

    /// @brief Reads of a block that had to be fetched on demand.
    std::uint64_t cacheMisses = 0;

    /// @brief Reads served by a direct range fetch, bypassing the cache.
    std::uint64_t directReads = 0;

    /// @brief Fetched blocks dropped to stay within the budget.
    std::uint64_t evictions = 0;

    /// @brief Highest number of cached plus in-flight blocks observed.
    std::size_t maxResidentBlocks = 0;

    /// @brief Bytes returned to the caller.
    std::uint64_t bytesRead = 0;
};

// =============================================================================
// PrefetchReader
// =============================================================================

class PrefetchReader {
public:
    /// @brief Open @p object using a shared worker pool.
    /// @throws LogicalError if the options are invalid or @p pool is null.
    /// @throws RemioException if the object size query fails.
    PrefetchReader(std::shared_ptr<core::RemoteObject> object, ReaderOptions options,
                   std::shared_ptr<core::WorkerPool> pool);

    /// @brief Open @p object with a private pool of config.workerCount threads.
    explicit PrefetchReader(std::shared_ptr<core::RemoteObject> object,
                            const EngineConfig& config = {});

    /// @brief Closes the reader; outstanding fetches are awaited.
    ~PrefetchReader();

    PrefetchReader(const PrefetchReader&) = delete;
    PrefetchReader& operator=(const PrefetchReader&) = delete;
    PrefetchReader(PrefetchReader&&) = delete;
    PrefetchReader& operator=(PrefetchReader&&) = delete;

    // =========================================================================
    // Stream Operations
    // =========================================================================

    /// @brief Read up to @p size bytes; nullopt reads to end of object.
    /// @note Returns fewer bytes only at end of object. On failure the cursor
    ///       is left where it was and the error context carries the first
    ///       byte offset that could not be served.
    [[nodiscard]] ByteBuffer read(std::optional<std::size_t> size = std::nullopt);

    /// @brief Fill @p buffer from the cursor.
    /// @return Bytes copied; less than buffer.size() only at end of object.
    std::size_t readInto(std::span<std::uint8_t> buffer);

    /// @brief Read up to and including the next '\n', at most @p limit bytes.
    [[nodiscard]] ByteBuffer readline(std::optional<std::size_t> limit = std::nullopt);

    /// @brief Move the cursor; the target is clamped to [0, size].
    /// @note Does not fetch or evict anything.
    /// @throws LogicalError(kUnsupported) for kEnd while the size is unknown.
    std::uint64_t seek(std::int64_t offset, Whence whence = Whence::kSet);

    [[nodiscard]] std::uint64_t tell() const noexcept { return cursor_; }

    /// @brief Object size, querying the backend again while unknown.
    /// @throws LogicalError(kUnsupported) if the backend cannot tell yet.
    [[nodiscard]] std::uint64_t size();

    /// @brief Object size if already known.
    [[nodiscard]] std::optional<std::uint64_t> knownSize() const noexcept { return size_; }

    [[nodiscard]] const std::string& name() const noexcept { return name_; }

    /// @brief Await every outstanding fetch and release the cache.
    /// @note Never throws; errors of speculative fetches are discarded.
    void close() noexcept;

    [[nodiscard]] bool closed() const noexcept { return closed_; }

    // =========================================================================
    // Introspection
    // =========================================================================

    [[nodiscard]] const ReaderStats& stats() const noexcept { return stats_; }

    /// @brief Blocks currently kept fetched from the cursor block onwards.
    [[nodiscard]] std::size_t prefetchWindow() const noexcept { return window_; }

    /// @brief Maximum number of cached plus in-flight blocks.
    [[nodiscard]] std::size_t blockCapacity() const noexcept { return capacity_; }

    /// @brief Blocks fetched and held in memory.
    [[nodiscard]] std::size_t readyBlocks() const noexcept;

    /// @brief Blocks cached or in flight.
    [[nodiscard]] std::size_t residentBlocks() const noexcept { return blocks_.size(); }

private:
    using FetchResult = Result<core::RangeResult>;
    using Sink = std::function<void(ByteSpan)>;

    /// @brief One cached block; a valid future means the fetch is in flight.
    struct BlockSlot {
        std::future<FetchResult> future;
        ByteBuffer data;
        std::optional<Error> error;
        std::uint64_t lastTouched = 0;

        [[nodiscard]] bool fetching() const noexcept { return future.valid(); }
    };

    /// @brief Seek pattern record used to size the prefetch window.
    struct SeekRecord {
        BlockIndex index = 0;
        std::uint64_t seeksSince = 0;
        std::uint64_t reads = 0;
    };

    void ensureOpen() const;

    std::size_t consume(std::uint64_t limit, bool stopAtNewline, const Sink& sink);
    const ByteBuffer& acquireBlock(BlockIndex index, std::uint64_t position);
    [[nodiscard]] bool shouldReadDirect(BlockIndex index) const;
    std::size_t readDirect(std::uint64_t length, const Sink& sink);

    void submitFetch(BlockIndex index);
    void schedulePrefetch(BlockIndex current);
    void harvestFinished();
    void completeSlot(BlockIndex index, BlockSlot& slot);
    [[nodiscard]] std::optional<Error> acceptResult(BlockIndex index, core::RangeResult& result);
    [[nodiscard]] std::optional<Error> checkVersion(const std::string& version);

    void makeRoomFor(BlockIndex current);
    bool evictOne(BlockIndex current);
    [[nodiscard]] bool inWindow(BlockIndex index, BlockIndex current) const noexcept;

    /// @brief Number of blocks that may hold data (max when unknown).
    [[nodiscard]] BlockIndex blockLimit() const noexcept;

    void recordSeek(BlockIndex index);
    void recordRead();
    void advanceCursor(std::uint64_t position);

    std::shared_ptr<core::RemoteObject> object_;
    ReaderOptions options_;
    std::shared_ptr<core::WorkerPool> pool_;
    std::shared_ptr<const core::RetryPolicy> retry_;
    std::shared_ptr<core::CancelToken> cancel_;
    std::string name_;

    std::size_t capacity_ = 1;
    std::size_t window_ = 1;
    bool autoscaleWindow_ = true;

    std::map<BlockIndex, BlockSlot> blocks_;
    std::vector<SeekRecord> seekHistory_;
    std::uint64_t clock_ = 0;

    std::uint64_t cursor_ = 0;
    std::optional<std::uint64_t> size_;
    std::optional<BlockIndex> emptyBlock_;
    std::string version_;

    std::uint64_t progressThreshold_ = kProgressLogInitial;
    ReaderStats stats_;
    bool closed_ = false;
};

}  // namespace remio::io

#endif  // REMIO_IO_PREFETCH_READER_H
