// =============================================================================
// remio - Content Checksums
// =============================================================================
// xxHash64 digests used as version tags (ETags) by the bundled backends.
// =============================================================================

#ifndef REMIO_COMMON_CHECKSUM_H
#define REMIO_COMMON_CHECKSUM_H

#include <cstdint>
#include <string>

#include <xxhash.h>

#include "remio/common/types.h"

namespace remio {

/// @brief Incremental xxHash64 over a sequence of byte ranges.
class ContentHasher {
public:
    ContentHasher();
    ~ContentHasher();

    ContentHasher(const ContentHasher&) = delete;
    ContentHasher& operator=(const ContentHasher&) = delete;

    void update(ByteSpan data);

    [[nodiscard]] std::uint64_t digest() const;

    /// @brief Digest as 16 lowercase hex digits.
    [[nodiscard]] std::string tag() const;

private:
    XXH64_state_t* state_;
};

/// @brief Hex xxHash64 tag of @p data.
[[nodiscard]] std::string contentTag(ByteSpan data);

}  // namespace remio

#endif  // REMIO_COMMON_CHECKSUM_H
