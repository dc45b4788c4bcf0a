// =============================================================================
// remio - Combined Reader Implementation
// =============================================================================

#include "remio/io/combined_reader.h"

#include <algorithm>
#include <limits>

#include <fmt/format.h>

#include "remio/common/error.h"
#include "remio/common/logger.h"

namespace remio::io {

CombinedReader::CombinedReader(std::vector<std::unique_ptr<PrefetchReader>> readers,
                               std::string name)
    : readers_(std::move(readers))
    , name_(std::move(name)) {
    starts_.reserve(readers_.size() + 1);
    std::uint64_t total = 0;
    for (const auto& reader : readers_) {
        if (!reader) {
            throw LogicalError(ErrorCode::kInvalidArgument,
                               fmt::format("combined reader {}: null member", name_));
        }
        if (reader->closed()) {
            throw LogicalError(ErrorCode::kInvalidState,
                               fmt::format("combined reader {}: member {} is closed", name_,
                                           reader->name()));
        }
        starts_.push_back(total);
        total += reader->size();
    }
    starts_.push_back(total);

    REMIO_LOG_DEBUG("open combined reader: {}, {} members, size={}", name_, readers_.size(),
                    humanSize(total));
}

CombinedReader::~CombinedReader() {
    close();
}

void CombinedReader::ensureOpen() const {
    if (closed_) {
        throw LogicalError(ErrorCode::kInvalidState,
                           fmt::format("I/O operation on closed reader: {}", name_));
    }
}

std::pair<std::size_t, std::uint64_t> CombinedReader::locate() const {
    // Last member starting at or before the cursor; empty members are skipped
    auto it = std::upper_bound(starts_.begin(), starts_.end() - 1, offset_);
    const auto index = static_cast<std::size_t>(std::distance(starts_.begin(), it) - 1);
    return {index, offset_ - starts_[index]};
}

ByteBuffer CombinedReader::read(std::optional<std::size_t> size) {
    ensureOpen();

    ByteBuffer out;
    if (offset_ >= this->size()) {
        return out;
    }
    std::uint64_t remaining = this->size() - offset_;
    if (size) {
        remaining = std::min<std::uint64_t>(remaining, *size);
    }
    out.reserve(static_cast<std::size_t>(remaining));

    while (remaining > 0 && offset_ < this->size()) {
        auto [index, inner] = locate();
        PrefetchReader& reader = *readers_[index];
        reader.seek(static_cast<std::int64_t>(inner));
        ByteBuffer data = reader.read(static_cast<std::size_t>(remaining));
        if (data.empty()) {
            throw IOError(fmt::format("member {} of {} ended early at offset {}", reader.name(),
                                      name_, inner),
                          ErrorContext(name_).withOffset(offset_));
        }
        out.insert(out.end(), data.begin(), data.end());
        remaining -= data.size();
        offset_ += data.size();
    }
    return out;
}

ByteBuffer CombinedReader::readline(std::optional<std::size_t> limit) {
    ensureOpen();

    ByteBuffer out;
    if (offset_ >= size()) {
        return out;
    }
    std::uint64_t remaining = size() - offset_;
    if (limit) {
        remaining = std::min<std::uint64_t>(remaining, *limit);
    }

    while (remaining > 0 && offset_ < size()) {
        auto [index, inner] = locate();
        PrefetchReader& reader = *readers_[index];
        reader.seek(static_cast<std::int64_t>(inner));
        ByteBuffer data = reader.readline(static_cast<std::size_t>(remaining));
        if (data.empty()) {
            throw IOError(fmt::format("member {} of {} ended early at offset {}", reader.name(),
                                      name_, inner),
                          ErrorContext(name_).withOffset(offset_));
        }
        out.insert(out.end(), data.begin(), data.end());
        remaining -= data.size();
        offset_ += data.size();
        if (data.back() == '\n') {
            break;
        }
    }
    return out;
}

std::uint64_t CombinedReader::seek(std::int64_t offset, Whence whence) {
    ensureOpen();

    std::int64_t target = 0;
    switch (whence) {
        case Whence::kSet:
            target = offset;
            break;
        case Whence::kCurrent:
            target = seekTarget(offset_, offset);
            break;
        case Whence::kEnd:
            target = seekTarget(size(), offset);
            break;
    }
    if (target < 0) {
        throw LogicalError(ErrorCode::kInvalidArgument,
                           fmt::format("negative seek value {} on {}", target, name_));
    }
    offset_ = static_cast<std::uint64_t>(target);
    return offset_;
}

void CombinedReader::close() noexcept {
    if (closed_) {
        return;
    }
    closed_ = true;
    for (auto& reader : readers_) {
        reader->close();
    }
}

}  // namespace remio::io
