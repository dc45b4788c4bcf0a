// =============================================================================
// remio - Content Checksums Implementation
// =============================================================================

#include "remio/common/checksum.h"

#include <new>

#include <fmt/format.h>

namespace remio {

ContentHasher::ContentHasher()
    : state_(XXH64_createState()) {
    if (state_ == nullptr) {
        throw std::bad_alloc();
    }
    XXH64_reset(state_, 0);
}

ContentHasher::~ContentHasher() {
    XXH64_freeState(state_);
}

void ContentHasher::update(ByteSpan data) {
    if (!data.empty()) {
        XXH64_update(state_, data.data(), data.size());
    }
}

std::uint64_t ContentHasher::digest() const {
    return XXH64_digest(state_);
}

std::string ContentHasher::tag() const {
    return fmt::format("{:016x}", digest());
}

std::string contentTag(ByteSpan data) {
    return fmt::format("{:016x}", XXH64(data.data(), data.size(), 0));
}

}  // namespace remio
