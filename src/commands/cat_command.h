// =============================================================================
// remio - Cat Command
// =============================================================================
// Command handler writing a byte range of an object to an output stream.
// =============================================================================

#ifndef REMIO_COMMANDS_CAT_COMMAND_H
#define REMIO_COMMANDS_CAT_COMMAND_H

#include <cstdint>
#include <filesystem>
#include <optional>
#include <ostream>

#include "remio/common/config.h"

namespace remio::commands {

/// @brief Configuration options for the cat command.
struct CatOptions {
    std::filesystem::path inputPath;

    /// @brief First byte to print.
    std::uint64_t offset = 0;

    /// @brief Bytes to print; unset prints to the end.
    std::optional<std::uint64_t> length;

    EngineConfig engine;
};

class CatCommand {
public:
    explicit CatCommand(CatOptions options);

    /// @brief Print the range to stdout.
    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

    /// @brief Print the range to @p out, throwing on failure.
    /// @return Bytes written.
    std::uint64_t run(std::ostream& out);

    [[nodiscard]] const CatOptions& options() const noexcept { return options_; }

private:
    CatOptions options_;
};

}  // namespace remio::commands

#endif  // REMIO_COMMANDS_CAT_COMMAND_H
