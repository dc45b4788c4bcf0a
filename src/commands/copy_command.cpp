// =============================================================================
// remio - Copy Command Implementation
// =============================================================================

#include "copy_command.h"

#include <algorithm>
#include <chrono>

#include <fmt/format.h>

#include "remio/backend/file_object.h"
#include "remio/common/checksum.h"
#include "remio/common/error.h"
#include "remio/common/logger.h"
#include "remio/core/worker_pool.h"
#include "remio/io/multipart_writer.h"
#include "remio/io/prefetch_reader.h"

namespace remio::commands {

CopyCommand::CopyCommand(CopyOptions options) : options_(std::move(options)) {}

int CopyCommand::execute() {
    try {
        run();
        return 0;
    } catch (const RemioException& e) {
        REMIO_LOG_ERROR("Copy failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        REMIO_LOG_ERROR("Unexpected error: {}", e.what());
        return 1;
    }
}

void CopyCommand::validatePaths() const {
    if (!std::filesystem::exists(options_.sourcePath)) {
        throw NotFoundError("Input file not found: " + options_.sourcePath.string());
    }

    std::error_code ec;
    if (std::filesystem::exists(options_.destinationPath) &&
        std::filesystem::equivalent(options_.sourcePath, options_.destinationPath, ec)) {
        throw LogicalError(ErrorCode::kInvalidArgument,
                           fmt::format("source and destination are the same file: {}",
                                       options_.sourcePath.string()));
    }

    if (std::filesystem::exists(options_.destinationPath) && !options_.forceOverwrite) {
        throw LogicalError(ErrorCode::kInvalidArgument,
                           fmt::format("destination exists (use --force): {}",
                                       options_.destinationPath.string()));
    }
}

CopyResult CopyCommand::run() {
    unwrapOrThrow(options_.engine.validate());
    validatePaths();

    const auto start = std::chrono::steady_clock::now();
    auto pool = std::make_shared<core::WorkerPool>(options_.engine.workerCount);

    io::PrefetchReader reader(std::make_shared<backend::FileObject>(options_.sourcePath),
                              options_.engine.reader, pool);
    io::MultipartWriter writer(std::make_shared<backend::FileObject>(options_.destinationPath),
                               options_.engine.writer, pool);

    ByteBuffer chunk(options_.engine.reader.blockSize);
    ContentHasher hasher;
    CopyResult result;
    while (true) {
        const std::size_t count = reader.readInto(chunk);
        if (count == 0) {
            break;
        }
        const ByteSpan bytes(chunk.data(), count);
        writer.write(bytes);
        hasher.update(bytes);
        result.bytesCopied += count;
    }

    writer.close();
    reader.close();

    result.partsUploaded = writer.stats().partsUploaded;
    result.blocksFetched = reader.stats().blocksFetched;
    result.checksum = hasher.tag();

    const auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start);
    REMIO_LOG_INFO("copied {} to {}: {} in {:.2f}s ({} blocks fetched, {} parts uploaded, "
                   "xxh64 {})",
                   options_.sourcePath.string(), options_.destinationPath.string(),
                   humanSize(result.bytesCopied), elapsed.count(), result.blocksFetched,
                   result.partsUploaded, result.checksum);
    return result;
}

}  // namespace remio::commands
