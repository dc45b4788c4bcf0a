// =============================================================================
// remio - Buffered Multipart Writer (write path)
// =============================================================================
// Presents a remote object as an append-only byte stream uploaded in parts.
//
// Written bytes accumulate in the current part. When it reaches the next
// block size the part is sealed and handed to the worker pool for upload, and
// a new part begins. Parts are numbered from 1, sealed and dispatched in
// order, and may finish uploading in any order; close() commits them with
// tokens sorted by part number.
//
// Memory is bounded by WriterOptions::maxBufferSize: sealing a part waits
// while uploads are in flight and the part would push sealed-but-unfinished
// bytes past the budget.
//
// Autoscale: when enabled the block size starts at the configured default and
// doubles as the number of sealed parts reaches 1/1000, 1/100 and 1/10 of
// the backend's part limit, capped at effectiveMaxBlockSize(). The size never
// shrinks during a session.
//
// State machine: Open -> Closing -> Closed, or Aborted from Open/Closing on
// any part or completion failure. A failed part is reported on the next
// write, flush or close, after abortUpload has been attempted.
// =============================================================================

#ifndef REMIO_IO_MULTIPART_WRITER_H
#define REMIO_IO_MULTIPART_WRITER_H

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "remio/common/config.h"
#include "remio/common/error.h"
#include "remio/common/types.h"
#include "remio/core/backend.h"
#include "remio/core/retry_policy.h"
#include "remio/core/worker_pool.h"

namespace remio::io {

// =============================================================================
// Writer State
// =============================================================================

enum class WriterState : std::uint8_t {
    kOpen = 0,
    kClosing = 1,
    kClosed = 2,
    kAborted = 3
};

[[nodiscard]] constexpr std::string_view writerStateToString(WriterState state) noexcept {
    switch (state) {
        case WriterState::kOpen:
            return "open";
        case WriterState::kClosing:
            return "closing";
        case WriterState::kClosed:
            return "closed";
        case WriterState::kAborted:
            return "aborted";
    }
    return "unknown";
}

/// @brief Counters describing one upload session.
struct WriterStats {
    std::uint64_t bytesWritten = 0;
    PartNumber partsSealed = 0;
    PartNumber partsUploaded = 0;
    std::size_t maxInFlightParts = 0;
    std::uint64_t maxBufferedBytes = 0;
};

// =============================================================================
// MultipartWriter
// =============================================================================

class MultipartWriter {
public:
    /// @brief Start an upload session on @p object using a shared pool.
    /// @throws LogicalError if the options are invalid or @p pool is null.
    MultipartWriter(std::shared_ptr<core::RemoteObject> object, WriterOptions options,
                    std::shared_ptr<core::WorkerPool> pool);

    /// @brief Start an upload session with a private pool of config.workerCount threads.
    explicit MultipartWriter(std::shared_ptr<core::RemoteObject> object,
                             const EngineConfig& config = {});

    /// @brief Aborts the session if it was never closed.
    ~MultipartWriter();

    MultipartWriter(const MultipartWriter&) = delete;
    MultipartWriter& operator=(const MultipartWriter&) = delete;
    MultipartWriter(MultipartWriter&&) = delete;
    MultipartWriter& operator=(MultipartWriter&&) = delete;

    /// @brief Append @p data. Always accepts every byte.
    /// @throws LogicalError after close.
    /// @throws UploadAbortedError if an earlier part failed.
    std::size_t write(ByteSpan data);

    std::size_t write(std::string_view text);

    /// @brief Seal and dispatch the current part if it holds any bytes.
    /// @note Does not wait for the upload.
    void flush();

    /// @brief Upload remaining bytes, wait for all parts and commit.
    /// @note A second call is a no-op.
    /// @throws UploadAbortedError if any part or the commit failed.
    void close();

    /// @brief Discard the session: cancel, wait and call abortUpload.
    /// @throws IOError if abortUpload itself fails.
    void abort();

    /// @brief Bytes accepted so far.
    [[nodiscard]] std::uint64_t tell() const noexcept { return bytesWritten_; }

    [[nodiscard]] const std::string& name() const noexcept { return name_; }

    [[nodiscard]] WriterState state() const noexcept { return state_; }

    [[nodiscard]] bool closed() const noexcept {
        return state_ == WriterState::kClosed || state_ == WriterState::kAborted;
    }

    /// @brief Size at which the current part will be sealed.
    [[nodiscard]] std::size_t nextBlockSize() const noexcept { return nextBlockSize_; }

    [[nodiscard]] WriterStats stats() const;

private:
    /// @brief State shared with upload tasks on the pool.
    struct UploadState {
        std::mutex mutex;
        std::condition_variable cv;
        std::uint64_t bufferedBytes = 0;
        std::size_t inFlight = 0;
        std::vector<core::PartToken> tokens;
        std::optional<Error> failure;
        std::optional<PartNumber> failedPart;
        std::size_t maxInFlight = 0;
        std::uint64_t maxBuffered = 0;
    };

    void ensureWritable() const;
    void checkFailure();

    void sealPart();
    void waitForBuffer(std::size_t partSize);
    void dispatch(PartNumber number, ByteBuffer data);
    void waitAll() noexcept;

    /// @brief Block size after @p sealedParts parts have been sealed.
    [[nodiscard]] std::size_t blockSizeFor(PartNumber sealedParts) const noexcept;

    [[noreturn]] void abortSession(const Error& cause, std::optional<PartNumber> part);
    [[nodiscard]] VoidResult abortRemote();

    std::shared_ptr<core::RemoteObject> object_;
    WriterOptions options_;
    std::shared_ptr<core::WorkerPool> pool_;
    std::shared_ptr<const core::RetryPolicy> retry_;
    std::shared_ptr<core::CancelToken> cancel_;
    std::shared_ptr<UploadState> shared_;
    std::string name_;

    PartNumber maxParts_ = kDefaultMaxPartCount;
    std::size_t nextBlockSize_ = 0;
    PartNumber nextPart_ = 1;
    ByteBuffer current_;
    std::uint64_t bytesWritten_ = 0;
    std::vector<std::future<void>> futures_;

    std::uint64_t progressThreshold_ = kProgressLogInitial;
    WriterState state_ = WriterState::kOpen;
};

}  // namespace remio::io

#endif  // REMIO_IO_MULTIPART_WRITER_H
