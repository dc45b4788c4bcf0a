// =============================================================================
// remio - Combined Reader
// =============================================================================
// Presents an ordered list of readers as one seekable stream whose size is
// the sum of the parts. Each member keeps its own block cache; the combined
// reader only routes the cursor to the member covering it.
// =============================================================================

#ifndef REMIO_IO_COMBINED_READER_H
#define REMIO_IO_COMBINED_READER_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "remio/common/types.h"
#include "remio/io/prefetch_reader.h"

namespace remio::io {

class CombinedReader {
public:
    /// @brief Combine @p readers in order. Member sizes are queried up front.
    /// @throws LogicalError if a member is null, closed or of unknown size.
    CombinedReader(std::vector<std::unique_ptr<PrefetchReader>> readers, std::string name);

    ~CombinedReader();

    CombinedReader(const CombinedReader&) = delete;
    CombinedReader& operator=(const CombinedReader&) = delete;

    /// @brief Read up to @p size bytes across member boundaries.
    [[nodiscard]] ByteBuffer read(std::optional<std::size_t> size = std::nullopt);

    /// @brief Read up to and including the next '\n', at most @p limit bytes.
    [[nodiscard]] ByteBuffer readline(std::optional<std::size_t> limit = std::nullopt);

    /// @brief Move the cursor. Targets past the end are allowed and read as EOF.
    /// @throws LogicalError(kInvalidArgument) for a negative target.
    std::uint64_t seek(std::int64_t offset, Whence whence = Whence::kSet);

    [[nodiscard]] std::uint64_t tell() const noexcept { return offset_; }

    [[nodiscard]] std::uint64_t size() const noexcept { return starts_.back(); }

    [[nodiscard]] const std::string& name() const noexcept { return name_; }

    /// @brief Close every member reader.
    void close() noexcept;

    [[nodiscard]] bool closed() const noexcept { return closed_; }

private:
    void ensureOpen() const;

    /// @brief Member covering the cursor and the offset inside it.
    [[nodiscard]] std::pair<std::size_t, std::uint64_t> locate() const;

    std::vector<std::unique_ptr<PrefetchReader>> readers_;
    /// @brief Start offset of each member plus the total size at the back.
    std::vector<std::uint64_t> starts_;
    std::string name_;
    std::uint64_t offset_ = 0;
    bool closed_ = false;
};

}  // namespace remio::io

#endif  // REMIO_IO_COMBINED_READER_H
