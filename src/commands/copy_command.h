// =============================================================================
// remio - Copy Command
// =============================================================================
// Command handler streaming one object into another.
//
// The source is read through a PrefetchReader and the destination written
// through a MultipartWriter, both sharing one worker pool. Memory stays within
// the reader and writer buffer budgets regardless of object size.
// =============================================================================

#ifndef REMIO_COMMANDS_COPY_COMMAND_H
#define REMIO_COMMANDS_COPY_COMMAND_H

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

#include "remio/common/config.h"

namespace remio::commands {

// =============================================================================
// Copy Options
// =============================================================================

/// @brief Configuration options for the copy command.
struct CopyOptions {
    /// @brief Object to read.
    std::filesystem::path sourcePath;

    /// @brief Object to create or replace.
    std::filesystem::path destinationPath;

    /// @brief Replace an existing destination.
    bool forceOverwrite = false;

    /// @brief Engine settings for both streams.
    EngineConfig engine;
};

/// @brief Outcome of a finished copy.
struct CopyResult {
    std::uint64_t bytesCopied = 0;
    std::uint32_t partsUploaded = 0;
    std::uint64_t blocksFetched = 0;

    /// @brief xxHash64 tag of the bytes copied.
    std::string checksum;
};

// =============================================================================
// CopyCommand Class
// =============================================================================

class CopyCommand {
public:
    explicit CopyCommand(CopyOptions options);

    CopyCommand(const CopyCommand&) = delete;
    CopyCommand& operator=(const CopyCommand&) = delete;

    /// @brief Execute the copy.
    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

    /// @brief Run the copy, throwing on failure.
    CopyResult run();

    [[nodiscard]] const CopyOptions& options() const noexcept { return options_; }

private:
    void validatePaths() const;

    CopyOptions options_;
};

}  // namespace remio::commands

#endif  // REMIO_COMMANDS_COPY_COMMAND_H
