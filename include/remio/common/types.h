// =============================================================================
// remio - Common Type Definitions
// =============================================================================
// Core type definitions shared by the read and write paths.
//
// This module defines:
// - ByteBuffer, ByteSpan: owned and borrowed byte ranges
// - BlockIndex, PartNumber: index aliases
// - Whence: seek origin
// - Size constants used as engine defaults
// - humanSize(): byte count formatting for log messages
// - seekTarget(): overflow-free relative seek arithmetic
//
// Naming Conventions:
// - Enums: PascalCase with kConstant values
// - Classes/Structs: PascalCase
// - Member variables: camelCase with trailing _
// - Constants: kConstant
// =============================================================================

#ifndef REMIO_COMMON_TYPES_H
#define REMIO_COMMON_TYPES_H

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace remio {

// =============================================================================
// Type Aliases
// =============================================================================

/// @brief Owned, contiguous byte storage.
using ByteBuffer = std::vector<std::uint8_t>;

/// @brief Borrowed read-only view of bytes.
using ByteSpan = std::span<const std::uint8_t>;

/// @brief Zero-based index of a read block (offset / blockSize).
using BlockIndex = std::uint64_t;

/// @brief One-based multipart part number.
using PartNumber = std::uint32_t;

// =============================================================================
// Constants
// =============================================================================

inline constexpr std::size_t kKiB = 1024;
inline constexpr std::size_t kMiB = 1024 * kKiB;
inline constexpr std::size_t kGiB = 1024 * kMiB;

/// @brief Default read block size.
inline constexpr std::size_t kDefaultReaderBlockSize = 8 * kMiB;

/// @brief Default read-side cache budget.
inline constexpr std::size_t kDefaultReaderMaxBufferSize = 128 * kMiB;

/// @brief Default (initial) write part size.
inline constexpr std::size_t kDefaultWriterBlockSize = 8 * kMiB;

/// @brief Default write-side buffer budget.
inline constexpr std::size_t kDefaultWriterMaxBufferSize = 128 * kMiB;

/// @brief Default number of pool threads.
inline constexpr std::size_t kDefaultWorkerCount = 8;

/// @brief Default number of attempts per network primitive.
inline constexpr std::uint32_t kDefaultMaxRetryTimes = 10;

/// @brief Default upper bound on parts in one multipart upload.
inline constexpr PartNumber kDefaultMaxPartCount = 10'000;

/// @brief First progress-log threshold for streams.
inline constexpr std::uint64_t kProgressLogInitial = 64 * kMiB;

/// @brief Growth factor of the progress-log threshold.
inline constexpr std::uint64_t kProgressLogFactor = 4;

// =============================================================================
// Enumerations
// =============================================================================

/// @brief Origin for seek operations.
enum class Whence : std::uint8_t {
    kSet = 0,      ///< Absolute offset from the start of the object
    kCurrent = 1,  ///< Relative to the current cursor
    kEnd = 2       ///< Relative to the end of the object
};

// =============================================================================
// Utility Functions
// =============================================================================

/// @brief Format a byte count for humans (e.g. "12.50 MiB").
[[nodiscard]] std::string humanSize(std::uint64_t bytes);

/// @brief @p base + @p delta as a signed seek target, saturating at the
/// int64 limits instead of overflowing.
[[nodiscard]] std::int64_t seekTarget(std::uint64_t base, std::int64_t delta) noexcept;

/// @brief Advance a geometric progress threshold past @p value.
/// @return true if @p value crossed the threshold (caller should log).
[[nodiscard]] inline bool advanceProgressThreshold(std::uint64_t value,
                                                   std::uint64_t& threshold) noexcept {
    if (value <= threshold) {
        return false;
    }
    while (value > threshold) {
        threshold *= kProgressLogFactor;
    }
    return true;
}

}  // namespace remio

#endif  // REMIO_COMMON_TYPES_H
