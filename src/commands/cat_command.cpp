// =============================================================================
// remio - Cat Command Implementation
// =============================================================================

#include "cat_command.h"

#include <algorithm>
#include <iostream>
#include <limits>
#include <memory>

#include "remio/backend/file_object.h"
#include "remio/common/error.h"
#include "remio/common/logger.h"
#include "remio/io/prefetch_reader.h"

namespace remio::commands {

CatCommand::CatCommand(CatOptions options) : options_(std::move(options)) {}

int CatCommand::execute() {
    try {
        run(std::cout);
        return 0;
    } catch (const RemioException& e) {
        REMIO_LOG_ERROR("Cat failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        REMIO_LOG_ERROR("Unexpected error: {}", e.what());
        return 1;
    }
}

std::uint64_t CatCommand::run(std::ostream& out) {
    unwrapOrThrow(options_.engine.validate());
    if (options_.offset > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        throw LogicalError(ErrorCode::kInvalidArgument, "offset out of range");
    }

    io::PrefetchReader reader(std::make_shared<backend::FileObject>(options_.inputPath),
                              options_.engine);
    reader.seek(static_cast<std::int64_t>(options_.offset));

    std::uint64_t remaining = options_.length.value_or(std::numeric_limits<std::uint64_t>::max());
    std::uint64_t written = 0;
    const std::size_t chunkSize = options_.engine.reader.blockSize;
    while (remaining > 0) {
        ByteBuffer data = reader.read(
            static_cast<std::size_t>(std::min<std::uint64_t>(remaining, chunkSize)));
        if (data.empty()) {
            break;
        }
        out.write(reinterpret_cast<const char*>(data.data()),
                  static_cast<std::streamsize>(data.size()));
        if (!out) {
            throw IOError("failed to write output");
        }
        remaining -= data.size();
        written += data.size();
    }
    out.flush();
    reader.close();

    REMIO_LOG_DEBUG("cat {}: {} from offset {}", options_.inputPath.string(), humanSize(written),
                    options_.offset);
    return written;
}

}  // namespace remio::commands
