// =============================================================================
// remio - In-Memory Backend Implementation
// =============================================================================

#include "remio/backend/memory_store.h"

#include <algorithm>

#include <fmt/format.h>

#include "remio/common/checksum.h"

namespace remio::backend {

// =============================================================================
// MemoryStore Implementation
// =============================================================================

MemoryStore::MemoryStore()
    : contents_(std::make_shared<Contents>()) {}

void MemoryStore::put(const std::string& name, ByteBuffer data) {
    std::string version = contentTag(ByteSpan(data));
    std::lock_guard lock(contents_->mutex);
    contents_->objects[name] = StoredObject{std::move(data), std::move(version)};
}

std::optional<ByteBuffer> MemoryStore::get(const std::string& name) const {
    std::lock_guard lock(contents_->mutex);
    auto it = contents_->objects.find(name);
    if (it == contents_->objects.end()) {
        return std::nullopt;
    }
    return it->second.data;
}

std::optional<std::string> MemoryStore::version(const std::string& name) const {
    std::lock_guard lock(contents_->mutex);
    auto it = contents_->objects.find(name);
    if (it == contents_->objects.end()) {
        return std::nullopt;
    }
    return it->second.version;
}

bool MemoryStore::contains(const std::string& name) const {
    std::lock_guard lock(contents_->mutex);
    return contents_->objects.contains(name);
}

bool MemoryStore::remove(const std::string& name) {
    std::lock_guard lock(contents_->mutex);
    return contents_->objects.erase(name) > 0;
}

std::size_t MemoryStore::objectCount() const {
    std::lock_guard lock(contents_->mutex);
    return contents_->objects.size();
}

std::shared_ptr<MemoryObject> MemoryStore::open(const std::string& name,
                                                PartNumber maxPartCount) {
    return std::shared_ptr<MemoryObject>(new MemoryObject(contents_, name, maxPartCount));
}

// =============================================================================
// MemoryObject Implementation
// =============================================================================

MemoryObject::MemoryObject(std::shared_ptr<MemoryStore::Contents> contents, std::string name,
                           PartNumber maxPartCount)
    : contents_(std::move(contents))
    , name_(std::move(name))
    , maxPartCount_(maxPartCount) {}

Result<core::RangeResult> MemoryObject::fetchRange(std::uint64_t offset, std::uint64_t length) {
    std::lock_guard lock(contents_->mutex);
    auto it = contents_->objects.find(name_);
    if (it == contents_->objects.end()) {
        return makeError(ErrorCode::kNotFound, fmt::format("no such object: {}", name()));
    }

    const ByteBuffer& data = it->second.data;
    if (offset >= data.size()) {
        return makeError(ErrorCode::kRangeNotSatisfiable,
                         fmt::format("range {}+{} of {} with size {}", offset, length, name(),
                                     data.size()));
    }

    const std::uint64_t end = std::min<std::uint64_t>(data.size(), offset + length);
    core::RangeResult result;
    result.data.assign(data.begin() + static_cast<std::ptrdiff_t>(offset),
                       data.begin() + static_cast<std::ptrdiff_t>(end));
    result.objectSize = data.size();
    result.version = it->second.version;
    return result;
}

Result<std::optional<std::uint64_t>> MemoryObject::objectSize() {
    std::lock_guard lock(contents_->mutex);
    auto it = contents_->objects.find(name_);
    if (it == contents_->objects.end()) {
        return makeError(ErrorCode::kNotFound, fmt::format("no such object: {}", name()));
    }
    return std::optional<std::uint64_t>(it->second.data.size());
}

Result<core::PartToken> MemoryObject::putPart(PartNumber number, ByteSpan data) {
    if (number == 0 || number > maxPartCount_) {
        return makeError(ErrorCode::kInvalidArgument,
                         fmt::format("part number {} out of range 1..{}", number, maxPartCount_));
    }

    core::PartToken token{number, contentTag(data), data.size()};
    std::lock_guard lock(stagingMutex_);
    stagedData_[number] = ByteBuffer(data.begin(), data.end());
    stagedTokens_[number] = token;
    return token;
}

VoidResult MemoryObject::completeUpload(const std::vector<core::PartToken>& tokens) {
    if (tokens.empty()) {
        return makeError(ErrorCode::kInvalidArgument,
                         fmt::format("complete {} without parts", name()));
    }

    ByteBuffer content;
    {
        std::lock_guard lock(stagingMutex_);
        PartNumber previous = 0;
        for (const auto& token : tokens) {
            if (token.number <= previous) {
                return makeError(ErrorCode::kInvalidArgument,
                                 fmt::format("parts of {} out of order at {}", name(),
                                             token.number));
            }
            previous = token.number;

            auto staged = stagedTokens_.find(token.number);
            if (staged == stagedTokens_.end() || staged->second.etag != token.etag) {
                return makeError(ErrorCode::kInvalidArgument,
                                 fmt::format("unknown part {} of {}", token.number, name()));
            }
            const ByteBuffer& part = stagedData_.at(token.number);
            content.insert(content.end(), part.begin(), part.end());
        }
        stagedData_.clear();
        stagedTokens_.clear();
    }

    std::string version = contentTag(ByteSpan(content));
    std::lock_guard lock(contents_->mutex);
    contents_->objects[name_] = MemoryStore::StoredObject{std::move(content), std::move(version)};
    return makeVoidSuccess();
}

VoidResult MemoryObject::abortUpload() {
    std::lock_guard lock(stagingMutex_);
    stagedData_.clear();
    stagedTokens_.clear();
    return makeVoidSuccess();
}

std::size_t MemoryObject::stagedParts() const {
    std::lock_guard lock(stagingMutex_);
    return stagedData_.size();
}

}  // namespace remio::backend
