// =============================================================================
// remio - Prefetching Reader Implementation
// =============================================================================

#include "remio/io/prefetch_reader.h"

#include <algorithm>
#include <chrono>
#include <cstring>
#include <limits>
#include <numeric>

#include <fmt/format.h>

#include "remio/common/logger.h"

namespace remio::io {

namespace {

/// @brief Reads since a seek below which a direct range fetch beats caching.
constexpr double kDirectReadThreshold = 3.0;

}  // namespace

// =============================================================================
// Construction / Destruction
// =============================================================================

PrefetchReader::PrefetchReader(std::shared_ptr<core::RemoteObject> object, ReaderOptions options,
                               std::shared_ptr<core::WorkerPool> pool)
    : object_(std::move(object))
    , options_(std::move(options))
    , pool_(std::move(pool))
    , cancel_(std::make_shared<core::CancelToken>()) {
    if (!object_) {
        throw LogicalError(ErrorCode::kInvalidArgument, "reader requires a remote object");
    }
    if (!pool_) {
        throw LogicalError(ErrorCode::kInvalidArgument, "reader requires a worker pool");
    }
    unwrapOrThrow(options_.validate());

    name_ = object_->name();
    retry_ = std::make_shared<const core::RetryPolicy>(options_.retry);
    capacity_ = options_.blockCapacity();
    autoscaleWindow_ = !options_.prefetchWindow.has_value();
    window_ = std::min(options_.prefetchWindow.value_or(capacity_), capacity_);

    auto sizeResult = retry_->run(
        fmt::format("stat {}", name_), [this] { return object_->objectSize(); }, cancel_.get());
    if (!sizeResult) {
        sizeResult.error().throwException(ErrorContext(name_));
    }
    size_ = *sizeResult;

    recordSeek(0);

    REMIO_LOG_DEBUG("open reader: {}, size={}, block={}, capacity={} blocks", name_,
                    size_ ? humanSize(*size_) : std::string("unknown"),
                    humanSize(options_.blockSize), capacity_);
}

PrefetchReader::PrefetchReader(std::shared_ptr<core::RemoteObject> object,
                               const EngineConfig& config)
    : PrefetchReader(std::move(object), config.reader,
                     std::make_shared<core::WorkerPool>(config.workerCount)) {}

PrefetchReader::~PrefetchReader() {
    close();
}

void PrefetchReader::ensureOpen() const {
    if (closed_) {
        throw LogicalError(ErrorCode::kInvalidState,
                           fmt::format("I/O operation on closed reader: {}", name_));
    }
}

// =============================================================================
// Stream Operations
// =============================================================================

ByteBuffer PrefetchReader::read(std::optional<std::size_t> size) {
    ensureOpen();
    recordRead();

    ByteBuffer out;
    if (size && *size == 0) {
        return out;
    }

    auto append = [&out](ByteSpan bytes) { out.insert(out.end(), bytes.begin(), bytes.end()); };

    if (size && shouldReadDirect(cursor_ / options_.blockSize)) {
        readDirect(*size, append);
        return out;
    }

    if (size) {
        std::uint64_t hint = *size;
        if (size_) {
            hint = std::min<std::uint64_t>(hint, *size_ > cursor_ ? *size_ - cursor_ : 0);
        } else {
            // The caller's length is only an upper bound until the size is known
            hint = std::min<std::uint64_t>(hint, std::uint64_t{capacity_} * options_.blockSize);
        }
        out.reserve(static_cast<std::size_t>(hint));
    }
    consume(size.value_or(std::numeric_limits<std::uint64_t>::max()), false, append);
    return out;
}

std::size_t PrefetchReader::readInto(std::span<std::uint8_t> buffer) {
    ensureOpen();
    recordRead();

    if (buffer.empty()) {
        return 0;
    }

    std::size_t written = 0;
    auto copy = [&buffer, &written](ByteSpan bytes) {
        std::memcpy(buffer.data() + written, bytes.data(), bytes.size());
        written += bytes.size();
    };

    if (shouldReadDirect(cursor_ / options_.blockSize)) {
        return readDirect(buffer.size(), copy);
    }
    return consume(buffer.size(), false, copy);
}

ByteBuffer PrefetchReader::readline(std::optional<std::size_t> limit) {
    ensureOpen();
    recordRead();

    ByteBuffer out;
    if (limit && *limit == 0) {
        return out;
    }
    consume(limit.value_or(std::numeric_limits<std::uint64_t>::max()), true,
            [&out](ByteSpan bytes) { out.insert(out.end(), bytes.begin(), bytes.end()); });
    return out;
}

std::uint64_t PrefetchReader::seek(std::int64_t offset, Whence whence) {
    ensureOpen();

    std::int64_t target = 0;
    switch (whence) {
        case Whence::kSet:
            target = offset;
            break;
        case Whence::kCurrent:
            target = seekTarget(cursor_, offset);
            break;
        case Whence::kEnd:
            target = seekTarget(size(), offset);
            break;
    }

    std::uint64_t position = target < 0 ? 0 : static_cast<std::uint64_t>(target);
    if (size_) {
        position = std::min(position, *size_);
    }
    if (position == cursor_) {
        return cursor_;
    }

    advanceCursor(position);
    recordSeek(position / options_.blockSize);
    return cursor_;
}

std::uint64_t PrefetchReader::size() {
    ensureOpen();
    if (size_) {
        return *size_;
    }

    auto result = retry_->run(
        fmt::format("stat {}", name_), [this] { return object_->objectSize(); }, cancel_.get());
    if (!result) {
        result.error().throwException(ErrorContext(name_));
    }
    if (!result->has_value()) {
        throw LogicalError(ErrorCode::kUnsupported,
                           fmt::format("size of {} is not known yet", name_));
    }
    size_ = **result;
    return *size_;
}

void PrefetchReader::close() noexcept {
    if (closed_) {
        return;
    }
    closed_ = true;
    cancel_->cancel();

    // Every submitted fetch must finish before the cache goes away
    for (auto& [index, slot] : blocks_) {
        if (slot.fetching()) {
            slot.future.wait();
        }
    }
    blocks_.clear();

    REMIO_LOG_DEBUG("close reader: {}, read={}, fetched={} blocks, hits={}, evictions={}", name_,
                    humanSize(stats_.bytesRead), stats_.blocksFetched, stats_.cacheHits,
                    stats_.evictions);
}

std::size_t PrefetchReader::readyBlocks() const noexcept {
    return static_cast<std::size_t>(std::count_if(
        blocks_.begin(), blocks_.end(), [](const auto& entry) { return !entry.second.fetching(); }));
}

// =============================================================================
// Block Consumption
// =============================================================================

std::size_t PrefetchReader::consume(std::uint64_t limit, bool stopAtNewline, const Sink& sink) {
    const std::uint64_t blockSize = options_.blockSize;
    std::uint64_t position = cursor_;
    std::uint64_t produced = 0;

    while (produced < limit) {
        if (size_ && position >= *size_) {
            break;
        }
        const BlockIndex index = position / blockSize;
        if (index >= blockLimit()) {
            break;
        }

        const ByteBuffer& data = acquireBlock(index, position);
        const std::uint64_t inBlock = position - index * blockSize;
        if (inBlock >= data.size()) {
            break;
        }

        std::uint64_t available = std::min<std::uint64_t>(data.size() - inBlock, limit - produced);
        const std::uint8_t* begin = data.data() + inBlock;
        bool lineDone = false;
        if (stopAtNewline) {
            const void* newline = std::memchr(begin, '\n', static_cast<std::size_t>(available));
            if (newline != nullptr) {
                available = static_cast<const std::uint8_t*>(newline) - begin + 1;
                lineDone = true;
            }
        }

        sink(ByteSpan(begin, static_cast<std::size_t>(available)));
        position += available;
        produced += available;
        if (lineDone) {
            break;
        }
    }

    stats_.bytesRead += produced;
    advanceCursor(position);
    return static_cast<std::size_t>(produced);
}

const ByteBuffer& PrefetchReader::acquireBlock(BlockIndex index, std::uint64_t position) {
    harvestFinished();

    if (blocks_.contains(index)) {
        ++stats_.cacheHits;
    } else {
        ++stats_.cacheMisses;
        makeRoomFor(index);
        submitFetch(index);
    }
    schedulePrefetch(index);

    BlockSlot& slot = blocks_.at(index);
    if (slot.fetching()) {
        completeSlot(index, slot);
    }

    if (slot.error) {
        Error error = std::move(*slot.error);
        blocks_.erase(index);
        REMIO_LOG_DEBUG("read {}: block {} unavailable at offset {}: {}", name_, index, position,
                        error.describe());
        error.throwException(ErrorContext(name_).withBlock(index).withOffset(position));
    }

    slot.lastTouched = ++clock_;
    return slot.data;
}

bool PrefetchReader::shouldReadDirect(BlockIndex index) const {
    if (window_ != 1 || blocks_.contains(index)) {
        return false;
    }
    if (seekHistory_.empty()) {
        return true;
    }
    const std::uint64_t reads = std::accumulate(
        seekHistory_.begin(), seekHistory_.end(), std::uint64_t{0},
        [](std::uint64_t sum, const SeekRecord& record) { return sum + record.reads; });
    const double mean = static_cast<double>(reads) / static_cast<double>(seekHistory_.size());
    return mean < kDirectReadThreshold;
}

std::size_t PrefetchReader::readDirect(std::uint64_t length, const Sink& sink) {
    const std::uint64_t position = cursor_;
    if (size_) {
        if (position >= *size_) {
            return 0;
        }
        length = std::min(length, *size_ - position);
    }

    auto result = retry_->run(
        fmt::format("read {} range {}+{}", name_, position, length),
        [&] { return object_->fetchRange(position, length); }, cancel_.get());
    if (!result) {
        if (result.error().code() == ErrorCode::kRangeNotSatisfiable) {
            return 0;
        }
        result.error().throwException(ErrorContext(name_).withOffset(position));
    }
    if (auto mismatch = checkVersion(result->version)) {
        throw FileChangedError(mismatch->message(), ErrorContext(name_).withOffset(position));
    }
    if (result->objectSize && !size_) {
        size_ = *result->objectSize;
    }

    ByteBuffer& data = result->data;
    if (data.size() > length) {
        data.resize(static_cast<std::size_t>(length));
    }
    if (data.size() < length && !data.empty() && !size_) {
        size_ = position + data.size();
    }

    sink(ByteSpan(data));
    ++stats_.directReads;
    stats_.bytesRead += data.size();
    advanceCursor(position + data.size());
    return data.size();
}

// =============================================================================
// Fetch Scheduling
// =============================================================================

void PrefetchReader::submitFetch(BlockIndex index) {
    const std::uint64_t length = options_.blockSize;
    const std::uint64_t offset = index * length;

    BlockSlot slot;
    slot.future = pool_->submit(
        [object = object_, retry = retry_, cancel = cancel_, offset, length,
         what = fmt::format("fetch {} block {}", name_, index)]() -> FetchResult {
            auto result = retry->run(
                what, [&] { return object->fetchRange(offset, length); }, cancel.get());
            // A block past the end is an empty block, not a failure
            if (!result && result.error().code() == ErrorCode::kRangeNotSatisfiable) {
                return core::RangeResult{};
            }
            return result;
        });
    slot.lastTouched = ++clock_;
    blocks_.emplace(index, std::move(slot));

    ++stats_.blocksFetched;
    stats_.maxResidentBlocks = std::max(stats_.maxResidentBlocks, blocks_.size());
}

void PrefetchReader::schedulePrefetch(BlockIndex current) {
    const BlockIndex limit = blockLimit();
    for (std::size_t step = 1; step < window_; ++step) {
        const BlockIndex index = current + step;
        if (index >= limit) {
            break;
        }
        if (blocks_.contains(index)) {
            continue;
        }
        if (blocks_.size() >= capacity_ && !evictOne(current)) {
            break;
        }
        submitFetch(index);
    }
}

void PrefetchReader::harvestFinished() {
    for (auto& [index, slot] : blocks_) {
        if (slot.fetching() &&
            slot.future.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
            completeSlot(index, slot);
        }
    }
}

void PrefetchReader::completeSlot(BlockIndex index, BlockSlot& slot) {
    FetchResult result = slot.future.get();
    if (!result) {
        slot.error = result.error();
        return;
    }
    if (auto failure = acceptResult(index, *result)) {
        slot.error = std::move(failure);
        return;
    }
    slot.data = std::move(result->data);
}

std::optional<Error> PrefetchReader::acceptResult(BlockIndex index, core::RangeResult& result) {
    if (auto mismatch = checkVersion(result.version)) {
        return mismatch;
    }
    if (result.objectSize && !size_) {
        size_ = *result.objectSize;
    }

    const std::uint64_t blockSize = options_.blockSize;
    if (result.data.size() > blockSize) {
        result.data.resize(static_cast<std::size_t>(blockSize));
    }
    if (result.data.size() < blockSize) {
        if (!result.data.empty() || index == 0) {
            if (!size_) {
                size_ = index * blockSize + result.data.size();
            }
        } else {
            emptyBlock_ = emptyBlock_ ? std::min(*emptyBlock_, index) : index;
        }
    }
    return std::nullopt;
}

std::optional<Error> PrefetchReader::checkVersion(const std::string& version) {
    if (version.empty()) {
        return std::nullopt;
    }
    if (version_.empty()) {
        version_ = version;
        return std::nullopt;
    }
    if (version != version_) {
        return Error{ErrorCode::kFileChanged,
                     fmt::format("{} changed while reading: version {} became {}", name_,
                                 version_, version)};
    }
    return std::nullopt;
}

// =============================================================================
// Eviction
// =============================================================================

void PrefetchReader::makeRoomFor(BlockIndex current) {
    while (blocks_.size() >= capacity_) {
        if (evictOne(current)) {
            continue;
        }
        // Only in-flight blocks remain outside the window; wait for the lowest
        auto pending = std::find_if(blocks_.begin(), blocks_.end(), [&](const auto& entry) {
            return entry.first != current && !inWindow(entry.first, current) &&
                   entry.second.fetching();
        });
        if (pending == blocks_.end()) {
            break;
        }
        pending->second.future.wait();
        completeSlot(pending->first, pending->second);
    }
}

bool PrefetchReader::evictOne(BlockIndex current) {
    auto victim = blocks_.end();

    // Blocks behind the cursor go first, lowest index first
    for (auto it = blocks_.begin(); it != blocks_.end() && it->first < current; ++it) {
        if (!it->second.fetching()) {
            victim = it;
            break;
        }
    }

    // Then the least recently used block outside the window
    if (victim == blocks_.end()) {
        for (auto it = blocks_.begin(); it != blocks_.end(); ++it) {
            if (it->second.fetching() || inWindow(it->first, current)) {
                continue;
            }
            if (victim == blocks_.end() ||
                it->second.lastTouched < victim->second.lastTouched) {
                victim = it;
            }
        }
    }

    if (victim == blocks_.end()) {
        return false;
    }
    blocks_.erase(victim);
    ++stats_.evictions;
    return true;
}

bool PrefetchReader::inWindow(BlockIndex index, BlockIndex current) const noexcept {
    return index >= current && index - current < window_;
}

BlockIndex PrefetchReader::blockLimit() const noexcept {
    if (size_) {
        return (*size_ + options_.blockSize - 1) / options_.blockSize;
    }
    if (emptyBlock_) {
        return *emptyBlock_;
    }
    return std::numeric_limits<BlockIndex>::max();
}

// =============================================================================
// Access Pattern Tracking
// =============================================================================

void PrefetchReader::recordSeek(BlockIndex index) {
    std::vector<SeekRecord> history;
    history.reserve(seekHistory_.size() + 1);
    for (SeekRecord record : seekHistory_) {
        if (record.seeksSince > 2 * capacity_) {
            continue;
        }
        // Neighbouring seeks are one sequential stream
        if (record.index + 1 >= index && record.index <= index + 1) {
            continue;
        }
        ++record.seeksSince;
        history.push_back(record);
    }
    history.push_back(SeekRecord{index, 0, 0});
    seekHistory_ = std::move(history);

    if (autoscaleWindow_) {
        window_ = std::max<std::size_t>(capacity_ / seekHistory_.size(), 1);
    }
}

void PrefetchReader::recordRead() {
    if (!seekHistory_.empty()) {
        ++seekHistory_.back().reads;
    }
}

void PrefetchReader::advanceCursor(std::uint64_t position) {
    cursor_ = position;
    if (advanceProgressThreshold(position, progressThreshold_)) {
        REMIO_LOG_DEBUG("reading {}: offset {} / {}", name_, humanSize(position),
                        size_ ? humanSize(*size_) : std::string("unknown"));
    }
}

}  // namespace remio::io
