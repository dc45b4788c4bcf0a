// =============================================================================
// remio - Engine Configuration
// =============================================================================
// Scalar configuration consumed by the stream engine.
//
// This module provides:
// - ReaderOptions: block size, cache budget, prefetch window
// - WriterOptions: part size (fixed or autoscaling), buffer budget
// - RetryOptions: attempt budget and backoff curve
// - EngineConfig: the above plus worker count, with environment overlay
// - parseQuantity(): "8Mi" / "200M" / "4096" style size parsing
//
// Environment variables (all optional):
//   REMIO_READER_BLOCK_SIZE       REMIO_READER_MAX_BUFFER_SIZE
//   REMIO_WRITER_BLOCK_SIZE       REMIO_WRITER_MAX_BUFFER_SIZE
//   REMIO_WRITER_BLOCK_AUTOSCALE  REMIO_MAX_WORKERS
//   REMIO_MAX_RETRY_TIMES
//
// Setting REMIO_WRITER_BLOCK_SIZE fixes the part size and disables autoscale
// unless REMIO_WRITER_BLOCK_AUTOSCALE re-enables it.
// =============================================================================

#ifndef REMIO_COMMON_CONFIG_H
#define REMIO_COMMON_CONFIG_H

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

#include "remio/common/error.h"
#include "remio/common/types.h"

namespace remio {

// =============================================================================
// Retry Options
// =============================================================================

/// @brief Backoff curve for a single network primitive.
struct RetryOptions {
    /// @brief Total attempts including the first one.
    std::uint32_t maxRetryTimes = kDefaultMaxRetryTimes;

    /// @brief Base delay; attempt n waits initialDelay * 2^n.
    std::chrono::milliseconds initialDelay{100};

    /// @brief Cap on a single wait.
    std::chrono::milliseconds maxDelay{30'000};

    [[nodiscard]] VoidResult validate() const;
};

// =============================================================================
// Reader Options
// =============================================================================

/// @brief Configuration of one prefetching reader.
struct ReaderOptions {
    /// @brief Size of one fetched block.
    std::size_t blockSize = kDefaultReaderBlockSize;

    /// @brief Byte budget for fetched and in-flight blocks.
    std::size_t maxBufferSize = kDefaultReaderMaxBufferSize;

    /// @brief Blocks kept fetched from the cursor block onwards.
    /// @note Unset means the window follows the seek pattern.
    std::optional<std::size_t> prefetchWindow;

    RetryOptions retry;

    /// @brief Number of blocks the budget holds, at least one.
    [[nodiscard]] std::size_t blockCapacity() const noexcept {
        if (blockSize == 0) {
            return 1;
        }
        return std::max<std::size_t>(maxBufferSize / blockSize, 1);
    }

    [[nodiscard]] VoidResult validate() const;
};

// =============================================================================
// Writer Options
// =============================================================================

/// @brief Configuration of one multipart writer.
struct WriterOptions {
    /// @brief Fixed part size. Setting it disables autoscale by default.
    std::optional<std::size_t> blockSize;

    /// @brief Initial part size when no fixed size is configured.
    std::size_t defaultBlockSize = kDefaultWriterBlockSize;

    /// @brief Upper bound for autoscaled part sizes (0 = maxBufferSize).
    std::size_t maxBlockSize = 0;

    /// @brief Byte budget for parts not yet uploaded.
    std::size_t maxBufferSize = kDefaultWriterMaxBufferSize;

    /// @brief Explicit autoscale switch; unset follows blockSize.
    std::optional<bool> blockAutoscale;

    RetryOptions retry;

    /// @brief Whether the part size grows with the part count.
    [[nodiscard]] bool autoscaleEnabled() const noexcept {
        return blockAutoscale.value_or(!blockSize.has_value());
    }

    /// @brief Part size used for the first part.
    [[nodiscard]] std::size_t initialBlockSize() const noexcept {
        return blockSize.value_or(defaultBlockSize);
    }

    /// @brief Effective ceiling for autoscaled part sizes.
    [[nodiscard]] std::size_t effectiveMaxBlockSize() const noexcept {
        std::size_t ceiling = maxBlockSize != 0 ? maxBlockSize : maxBufferSize;
        return std::max(ceiling, initialBlockSize());
    }

    [[nodiscard]] VoidResult validate() const;
};

// =============================================================================
// Engine Configuration
// =============================================================================

/// @brief Complete engine configuration.
struct EngineConfig {
    ReaderOptions reader;
    WriterOptions writer;

    /// @brief Threads in a pool created for streams without a shared pool.
    std::size_t workerCount = kDefaultWorkerCount;

    /// @brief Set the attempt budget for both paths.
    void setMaxRetryTimes(std::uint32_t times) noexcept {
        reader.retry.maxRetryTimes = times;
        writer.retry.maxRetryTimes = times;
    }

    /// @brief Defaults overlaid with REMIO_* environment variables.
    [[nodiscard]] static Result<EngineConfig> fromEnvironment();

    [[nodiscard]] VoidResult validate() const;
};

// =============================================================================
// Parsing Utilities
// =============================================================================

/// @brief Parse a size quantity.
/// @note Base-1024 suffixes: Ki Mi Gi Ti Pi Ei. Base-1000 suffixes:
///       k K M G T P E. "ki" is rejected.
[[nodiscard]] Result<std::uint64_t> parseQuantity(std::string_view quantity);

/// @brief Parse "true"/"yes"/"1" (case-insensitive) as true, anything else false.
[[nodiscard]] bool parseBoolean(std::string_view value) noexcept;

}  // namespace remio

#endif  // REMIO_COMMON_CONFIG_H
