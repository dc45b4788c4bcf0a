// =============================================================================
// remio - Backend Capability Interface
// =============================================================================
// The engine never talks to a concrete protocol. Each backend exposes one
// RemoteObject per object, implementing five primitives:
//
//   fetchRange(offset, length)   -> RangeResult
//   objectSize()                 -> size, or nullopt until first fetch
//   putPart(number, bytes)       -> PartToken
//   completeUpload(tokens)       -> ()
//   abortUpload()                -> ()
//
// Every primitive returns a Result so the retry policy can branch on the
// error classification without exceptions. Primitives are called
// concurrently from pool threads and must be thread-safe. Connection state a
// backend needs is owned by the backend object and passed in explicitly.
// =============================================================================

#ifndef REMIO_CORE_BACKEND_H
#define REMIO_CORE_BACKEND_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "remio/common/error.h"
#include "remio/common/types.h"

namespace remio::core {

/// @brief Bytes returned by one ranged fetch.
struct RangeResult {
    /// @brief Payload; shorter than requested only at end of object.
    ByteBuffer data;

    /// @brief Total object size, when the backend reports it (Content-Range).
    std::optional<std::uint64_t> objectSize;

    /// @brief Version tag (ETag) of the object the bytes came from.
    std::string version;
};

/// @brief Result of a successful part upload.
struct PartToken {
    PartNumber number = 0;
    std::string etag;
    std::uint64_t size = 0;

    [[nodiscard]] bool operator==(const PartToken& other) const = default;
};

/// @brief Network primitives for a single remote object.
class RemoteObject {
public:
    virtual ~RemoteObject() = default;

    /// @brief Human-readable name (URL or path) for logs and errors.
    [[nodiscard]] virtual std::string name() const = 0;

    /// @brief Fetch up to @p length bytes starting at @p offset.
    /// @note Fails with kNotFound if the object is gone and
    ///       kRangeNotSatisfiable if offset >= object size.
    [[nodiscard]] virtual Result<RangeResult> fetchRange(std::uint64_t offset,
                                                         std::uint64_t length) = 0;

    /// @brief Object size, or nullopt when only a fetch can reveal it.
    [[nodiscard]] virtual Result<std::optional<std::uint64_t>> objectSize() = 0;

    /// @brief Upload one part. Re-uploading a number overwrites it.
    [[nodiscard]] virtual Result<PartToken> putPart(PartNumber number, ByteSpan data) = 0;

    /// @brief Commit the upload from tokens ordered by part number.
    [[nodiscard]] virtual VoidResult completeUpload(const std::vector<PartToken>& tokens) = 0;

    /// @brief Discard all uploaded parts of the current session.
    [[nodiscard]] virtual VoidResult abortUpload() = 0;

    /// @brief Largest part number the backend accepts.
    [[nodiscard]] virtual PartNumber maxPartCount() const { return kDefaultMaxPartCount; }
};

}  // namespace remio::core

#endif  // REMIO_CORE_BACKEND_H
