// =============================================================================
// remio - Remote Object Stream Tool
// =============================================================================
// Main entry point for the remio command-line tool.
//
// This file implements the CLI framework using CLI11, providing:
// - Subcommands: cp, cat
// - Global options: block size, buffer budget, workers, retries, verbosity
// - Engine configuration from REMIO_* environment variables, overridden by
//   command-line options
// =============================================================================

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

#include "remio/common/config.h"
#include "remio/common/error.h"
#include "remio/common/logger.h"
#include "remio/common/types.h"

#include "commands/cat_command.h"
#include "commands/copy_command.h"

namespace remio::commands {
int runCopy(const EngineConfig& engine);
int runCat(const EngineConfig& engine);
}  // namespace remio::commands

namespace {

// =============================================================================
// Version Information
// =============================================================================

constexpr const char* kVersion = "0.1.0";
constexpr const char* kDescription =
    "remio: stream remote objects through a prefetching block cache and\n"
    "buffered multipart uploads.";

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    std::string blockSize;      // Quantity, e.g. "8Mi"; empty = configured default
    std::string maxBuffer;      // Quantity; empty = configured default
    std::size_t workers = 0;    // 0 = configured default
    std::uint32_t retries = 0;  // 0 = configured default
    int verbosity = 0;          // 0 = warnings, 1 = info, 2 = debug
    std::string logFile;
};

GlobalOptions gOptions;

// =============================================================================
// Command Options
// =============================================================================

struct CliCopyOptions {
    std::string source;
    std::string destination;
    bool force = false;
};

CliCopyOptions gCopyOpts;

struct CliCatOptions {
    std::string input;
    std::uint64_t offset = 0;
    std::optional<std::uint64_t> length;
};

CliCatOptions gCatOpts;

// =============================================================================
// Command Setup Functions
// =============================================================================

void setupCopyCommand(CLI::App& app) {
    auto* copy = app.add_subcommand("cp", "Copy an object through the stream engine");
    copy->alias("copy");

    copy->add_option("source", gCopyOpts.source, "Object to read")
        ->required()
        ->check(CLI::ExistingFile);

    copy->add_option("destination", gCopyOpts.destination, "Object to write")->required();

    copy->add_flag("-f,--force", gCopyOpts.force, "Overwrite an existing destination");
}

void setupCatCommand(CLI::App& app) {
    auto* cat = app.add_subcommand("cat", "Write a byte range of an object to stdout");

    cat->add_option("path", gCatOpts.input, "Object to read")
        ->required()
        ->check(CLI::ExistingFile);

    cat->add_option("--offset", gCatOpts.offset, "First byte to print")->default_val(0);

    cat->add_option("--length", gCatOpts.length, "Number of bytes to print (default: to end)");
}

/// @brief Engine configuration from the environment, overridden by options.
remio::EngineConfig buildEngineConfig() {
    auto config = remio::unwrapOrThrow(remio::EngineConfig::fromEnvironment());

    if (!gOptions.blockSize.empty()) {
        const auto blockSize =
            static_cast<std::size_t>(remio::unwrapOrThrow(remio::parseQuantity(gOptions.blockSize)));
        config.reader.blockSize = blockSize;
        config.writer.blockSize = blockSize;
    }
    if (!gOptions.maxBuffer.empty()) {
        const auto maxBuffer =
            static_cast<std::size_t>(remio::unwrapOrThrow(remio::parseQuantity(gOptions.maxBuffer)));
        config.reader.maxBufferSize = maxBuffer;
        config.writer.maxBufferSize = maxBuffer;
    }
    if (gOptions.workers > 0) {
        config.workerCount = gOptions.workers;
    }
    if (gOptions.retries > 0) {
        config.setMaxRetryTimes(gOptions.retries);
    }

    remio::unwrapOrThrow(config.validate());
    return config;
}

}  // namespace

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char* argv[]) {
    CLI::App app{kDescription};
    app.set_version_flag("-V,--version", kVersion);

    // Global options
    app.add_option("--block-size", gOptions.blockSize,
                   "Read block and write part size (e.g. 8Mi, 200M)");

    app.add_option("--max-buffer", gOptions.maxBuffer,
                   "Read cache and write buffer budget (e.g. 128Mi)");

    app.add_option("--workers", gOptions.workers, "Worker threads (0 = default)")
        ->check(CLI::NonNegativeNumber);

    app.add_option("--retries", gOptions.retries, "Attempts per network operation (0 = default)")
        ->check(CLI::NonNegativeNumber);

    app.add_flag("-v,--verbose", gOptions.verbosity, "Increase verbosity (-v, -vv for debug)");

    app.add_option("--log-file", gOptions.logFile, "Also write log messages to this file");

    // Setup subcommands
    setupCopyCommand(app);
    setupCatCommand(app);

    // Require a subcommand
    app.require_subcommand(1);

    // Parse arguments
    CLI11_PARSE(app, argc, argv);

    // Initialize logger
    try {
        auto logLevel = remio::log::levelFromEnvironment();
        if (gOptions.verbosity >= 2) {
            logLevel = remio::log::Level::kDebug;
        } else if (gOptions.verbosity >= 1) {
            logLevel = remio::log::Level::kInfo;
        }
        remio::log::init(gOptions.logFile, logLevel);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logger: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    // Dispatch to subcommand handlers
    int exitCode = EXIT_SUCCESS;
    try {
        const auto engine = buildEngineConfig();
        if (app.got_subcommand("cp")) {
            exitCode = remio::commands::runCopy(engine);
        } else if (app.got_subcommand("cat")) {
            exitCode = remio::commands::runCat(engine);
        }
    } catch (const remio::RemioException& ex) {
        REMIO_LOG_ERROR("Error: {}", ex.what());
        exitCode = ex.exitCode();
    } catch (const std::exception& ex) {
        REMIO_LOG_ERROR("Unexpected error: {}", ex.what());
        exitCode = EXIT_FAILURE;
    }

    remio::log::flush();
    return exitCode;
}

// =============================================================================
// Command Implementations
// =============================================================================

namespace remio::commands {

int runCopy(const EngineConfig& engine) {
    CopyOptions opts;
    opts.sourcePath = gCopyOpts.source;
    opts.destinationPath = gCopyOpts.destination;
    opts.forceOverwrite = gCopyOpts.force;
    opts.engine = engine;

    CopyCommand cmd(std::move(opts));
    return cmd.execute();
}

int runCat(const EngineConfig& engine) {
    CatOptions opts;
    opts.inputPath = gCatOpts.input;
    opts.offset = gCatOpts.offset;
    opts.length = gCatOpts.length;
    opts.engine = engine;

    CatCommand cmd(std::move(opts));
    return cmd.execute();
}

}  // namespace remio::commands
