// =============================================================================
// remio - Buffered Multipart Writer Implementation
// =============================================================================

#include "remio/io/multipart_writer.h"

#include <algorithm>

#include <fmt/format.h>

#include "remio/common/logger.h"

namespace remio::io {

// =============================================================================
// Construction / Destruction
// =============================================================================

MultipartWriter::MultipartWriter(std::shared_ptr<core::RemoteObject> object,
                                 WriterOptions options, std::shared_ptr<core::WorkerPool> pool)
    : object_(std::move(object))
    , options_(std::move(options))
    , pool_(std::move(pool))
    , cancel_(std::make_shared<core::CancelToken>())
    , shared_(std::make_shared<UploadState>()) {
    if (!object_) {
        throw LogicalError(ErrorCode::kInvalidArgument, "writer requires a remote object");
    }
    if (!pool_) {
        throw LogicalError(ErrorCode::kInvalidArgument, "writer requires a worker pool");
    }
    unwrapOrThrow(options_.validate());

    name_ = object_->name();
    retry_ = std::make_shared<const core::RetryPolicy>(options_.retry);
    maxParts_ = std::max<PartNumber>(object_->maxPartCount(), 1);
    nextBlockSize_ = blockSizeFor(0);

    REMIO_LOG_DEBUG("open writer: {}, block={}, autoscale={}, buffer={}", name_,
                    humanSize(nextBlockSize_), options_.autoscaleEnabled(),
                    humanSize(options_.maxBufferSize));
}

MultipartWriter::MultipartWriter(std::shared_ptr<core::RemoteObject> object,
                                 const EngineConfig& config)
    : MultipartWriter(std::move(object), config.writer,
                      std::make_shared<core::WorkerPool>(config.workerCount)) {}

MultipartWriter::~MultipartWriter() {
    if (state_ == WriterState::kOpen || state_ == WriterState::kClosing) {
        REMIO_LOG_WARNING("writer {} destroyed without close, aborting upload", name_);
        state_ = WriterState::kAborted;
        if (auto result = abortRemote(); !result) {
            REMIO_LOG_ERROR("abort upload {} failed: {}", name_, result.error().describe());
        }
    }
    waitAll();
}

// =============================================================================
// Stream Operations
// =============================================================================

std::size_t MultipartWriter::write(ByteSpan data) {
    ensureWritable();
    checkFailure();

    std::size_t offset = 0;
    while (offset < data.size()) {
        if (current_.empty()) {
            current_.reserve(nextBlockSize_);
        }
        const std::size_t room = nextBlockSize_ - current_.size();
        const std::size_t count = std::min(room, data.size() - offset);
        current_.insert(current_.end(), data.begin() + static_cast<std::ptrdiff_t>(offset),
                        data.begin() + static_cast<std::ptrdiff_t>(offset + count));
        offset += count;
        bytesWritten_ += count;

        if (current_.size() >= nextBlockSize_) {
            sealPart();
        }
    }

    if (advanceProgressThreshold(bytesWritten_, progressThreshold_)) {
        REMIO_LOG_DEBUG("writing {}: {} written, {} parts", name_, humanSize(bytesWritten_),
                        nextPart_ - 1);
    }
    return data.size();
}

std::size_t MultipartWriter::write(std::string_view text) {
    return write(ByteSpan(reinterpret_cast<const std::uint8_t*>(text.data()), text.size()));
}

void MultipartWriter::flush() {
    ensureWritable();
    checkFailure();
    if (!current_.empty()) {
        sealPart();
    }
}

void MultipartWriter::close() {
    if (closed()) {
        return;
    }
    state_ = WriterState::kClosing;

    // An empty object is uploaded as a single empty part
    if (!current_.empty() || (bytesWritten_ == 0 && nextPart_ == 1)) {
        sealPart();
    }

    waitAll();
    checkFailure();

    std::vector<core::PartToken> tokens;
    {
        std::lock_guard lock(shared_->mutex);
        tokens = shared_->tokens;
    }
    std::sort(tokens.begin(), tokens.end(),
              [](const core::PartToken& a, const core::PartToken& b) { return a.number < b.number; });

    auto result = retry_->run(
        fmt::format("complete upload {}", name_),
        [&] { return object_->completeUpload(tokens); }, cancel_.get());
    if (!result) {
        abortSession(result.error(), std::nullopt);
    }

    state_ = WriterState::kClosed;
    REMIO_LOG_DEBUG("close writer: {}, {} in {} parts", name_, humanSize(bytesWritten_),
                    tokens.size());
}

void MultipartWriter::abort() {
    if (closed()) {
        return;
    }
    state_ = WriterState::kAborted;
    REMIO_LOG_WARNING("abort upload {} on request", name_);
    unwrapOrThrow(abortRemote());
}

WriterStats MultipartWriter::stats() const {
    WriterStats stats;
    stats.bytesWritten = bytesWritten_;
    stats.partsSealed = nextPart_ - 1;

    std::lock_guard lock(shared_->mutex);
    stats.partsUploaded = static_cast<PartNumber>(shared_->tokens.size());
    stats.maxInFlightParts = shared_->maxInFlight;
    stats.maxBufferedBytes = shared_->maxBuffered;
    return stats;
}

// =============================================================================
// Part Handling
// =============================================================================

void MultipartWriter::ensureWritable() const {
    if (state_ != WriterState::kOpen) {
        throw LogicalError(ErrorCode::kInvalidState,
                           fmt::format("write to {} writer: {}", writerStateToString(state_),
                                       name_));
    }
}

void MultipartWriter::checkFailure() {
    std::optional<Error> failure;
    std::optional<PartNumber> part;
    {
        std::lock_guard lock(shared_->mutex);
        failure = shared_->failure;
        part = shared_->failedPart;
    }
    if (failure) {
        abortSession(*failure, part);
    }
}

void MultipartWriter::sealPart() {
    const PartNumber number = nextPart_;
    if (number > maxParts_) {
        abortSession(Error{ErrorCode::kIOError,
                           fmt::format("part {} exceeds the backend limit of {} parts", number,
                                       maxParts_)},
                     number);
    }

    ByteBuffer part = std::move(current_);
    current_ = ByteBuffer{};

    waitForBuffer(part.size());
    checkFailure();

    dispatch(number, std::move(part));
    ++nextPart_;

    // Monotonic: the block size only ever grows within a session
    nextBlockSize_ = std::max(nextBlockSize_, blockSizeFor(nextPart_ - 1));
}

void MultipartWriter::waitForBuffer(std::size_t partSize) {
    std::unique_lock lock(shared_->mutex);
    shared_->cv.wait(lock, [&] {
        return shared_->failure.has_value() || shared_->inFlight == 0 ||
               shared_->bufferedBytes + partSize <= options_.maxBufferSize;
    });
}

void MultipartWriter::dispatch(PartNumber number, ByteBuffer data) {
    const std::size_t size = data.size();
    {
        std::lock_guard lock(shared_->mutex);
        shared_->bufferedBytes += size;
        ++shared_->inFlight;
        shared_->maxInFlight = std::max(shared_->maxInFlight, shared_->inFlight);
        shared_->maxBuffered = std::max(shared_->maxBuffered, shared_->bufferedBytes);
    }

    auto upload = [state = shared_, object = object_, retry = retry_, cancel = cancel_, number,
                   data = std::move(data),
                   what = fmt::format("upload {} part {}", name_, number)]() {
        // Retries resend the same part number and bytes
        auto result = retry->run(
            what, [&] { return object->putPart(number, ByteSpan(data)); }, cancel.get());

        std::lock_guard lock(state->mutex);
        state->bufferedBytes -= data.size();
        --state->inFlight;
        if (result) {
            core::PartToken token = std::move(*result);
            token.number = number;
            token.size = data.size();
            state->tokens.push_back(std::move(token));
        } else if (!state->failure) {
            state->failure = result.error();
            state->failedPart = number;
        }
        state->cv.notify_all();
    };

    std::future<void> future;
    try {
        future = pool_->submit(std::move(upload));
    } catch (const RemioException& e) {
        // The part never reached the pool, so the upload can no longer be complete
        {
            std::lock_guard lock(shared_->mutex);
            shared_->bufferedBytes -= size;
            --shared_->inFlight;
            shared_->cv.notify_all();
        }
        abortSession(Error{e.code(), fmt::format("dispatch part {}: {}", number, e.message())},
                     number);
    }
    futures_.push_back(std::move(future));
}

void MultipartWriter::waitAll() noexcept {
    for (auto& future : futures_) {
        if (future.valid()) {
            future.wait();
        }
    }
    futures_.clear();
}

std::size_t MultipartWriter::blockSizeFor(PartNumber sealedParts) const noexcept {
    const std::size_t base = options_.initialBlockSize();
    if (!options_.autoscaleEnabled()) {
        return base;
    }

    // Sealing past maxParts_ aborts, so x8 is the last step
    std::size_t multiplier = 8;
    if (sealedParts < std::max<PartNumber>(maxParts_ / 1000, 1)) {
        multiplier = 1;
    } else if (sealedParts < std::max<PartNumber>(maxParts_ / 100, 1)) {
        multiplier = 2;
    } else if (sealedParts < std::max<PartNumber>(maxParts_ / 10, 1)) {
        multiplier = 4;
    }
    return std::min(base * multiplier, options_.effectiveMaxBlockSize());
}

// =============================================================================
// Abort Handling
// =============================================================================

void MultipartWriter::abortSession(const Error& cause, std::optional<PartNumber> part) {
    state_ = WriterState::kAborted;
    current_.clear();

    ErrorContext context(name_);
    if (part) {
        context.withPart(*part);
    }
    UploadAbortedError error(cause.code(),
                             fmt::format("upload of {} aborted: {}", name_, cause.describe()),
                             context);
    REMIO_LOG_WARNING("abort upload {}: {}", name_, cause.describe());

    if (auto result = abortRemote(); !result) {
        REMIO_LOG_ERROR("abort upload {} failed: {}", name_, result.error().describe());
        error.setAbortFailure(result.error().describe());
    }
    throw error;
}

VoidResult MultipartWriter::abortRemote() {
    cancel_->cancel();
    waitAll();
    // The cancel token is already set, so the abort call runs without one
    return retry_->run(fmt::format("abort upload {}", name_),
                       [this] { return object_->abortUpload(); });
}

}  // namespace remio::io
