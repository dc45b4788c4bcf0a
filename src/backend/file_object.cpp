// =============================================================================
// remio - Local File Backend Implementation
// =============================================================================

#include "remio/backend/file_object.h"

#include <algorithm>
#include <fstream>

#include <fmt/format.h>

#include "remio/common/checksum.h"
#include "remio/common/logger.h"

namespace remio::backend {

namespace {

constexpr const char* kStagingSuffix = ".remio-upload";
constexpr const char* kCompleteName = ".complete";

}  // namespace

Error errorFromSystem(std::error_code ec, std::string message) {
    ErrorCode code = ErrorCode::kIOError;
    if (ec == std::errc::no_such_file_or_directory) {
        code = ErrorCode::kNotFound;
    } else if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted) {
        code = ErrorCode::kPermissionDenied;
    } else if (ec == std::errc::timed_out) {
        code = ErrorCode::kTimeout;
    } else if (ec == std::errc::interrupted || ec == std::errc::resource_unavailable_try_again) {
        code = ErrorCode::kServerError;
    }
    return Error{code, fmt::format("{}: {}", message, ec.message())};
}

FileObject::FileObject(std::filesystem::path path, PartNumber maxPartCount)
    : path_(std::move(path))
    , maxPartCount_(maxPartCount) {}

std::filesystem::path FileObject::stagingDirectory() const {
    std::filesystem::path staging = path_;
    staging += kStagingSuffix;
    return staging;
}

std::filesystem::path FileObject::partPath(PartNumber number) const {
    return stagingDirectory() / fmt::format("part-{:05}", number);
}

Result<std::string> FileObject::currentVersion() const {
    std::error_code ec;
    const auto size = std::filesystem::file_size(path_, ec);
    if (ec) {
        return makeError(errorFromSystem(ec, fmt::format("stat {}", name())));
    }
    const auto modified = std::filesystem::last_write_time(path_, ec);
    if (ec) {
        return makeError(errorFromSystem(ec, fmt::format("stat {}", name())));
    }
    return fmt::format("{:x}-{:x}", static_cast<long long>(modified.time_since_epoch().count()),
                       size);
}

// =============================================================================
// Read Primitives
// =============================================================================

Result<core::RangeResult> FileObject::fetchRange(std::uint64_t offset, std::uint64_t length) {
    std::error_code ec;
    const auto size = std::filesystem::file_size(path_, ec);
    if (ec) {
        return makeError(errorFromSystem(ec, fmt::format("fetch {}", name())));
    }
    if (offset >= size) {
        return makeError(ErrorCode::kRangeNotSatisfiable,
                         fmt::format("range {}+{} of {} with size {}", offset, length, name(),
                                     size));
    }

    auto version = currentVersion();
    if (!version) {
        return makeError(version.error());
    }

    std::ifstream stream(path_, std::ios::binary);
    if (!stream) {
        return makeError(ErrorCode::kIOError, fmt::format("cannot open {}", name()));
    }
    stream.seekg(static_cast<std::streamoff>(offset));

    core::RangeResult result;
    result.data.resize(static_cast<std::size_t>(std::min<std::uint64_t>(length, size - offset)));
    stream.read(reinterpret_cast<char*>(result.data.data()),
                static_cast<std::streamsize>(result.data.size()));
    if (stream.bad()) {
        return makeError(ErrorCode::kIOError, fmt::format("read failed on {}", name()));
    }
    result.data.resize(static_cast<std::size_t>(stream.gcount()));
    result.objectSize = size;
    result.version = std::move(*version);
    return result;
}

Result<std::optional<std::uint64_t>> FileObject::objectSize() {
    std::error_code ec;
    const auto size = std::filesystem::file_size(path_, ec);
    if (ec) {
        return makeError(errorFromSystem(ec, fmt::format("stat {}", name())));
    }
    return std::optional<std::uint64_t>(size);
}

// =============================================================================
// Upload Primitives
// =============================================================================

Result<core::PartToken> FileObject::putPart(PartNumber number, ByteSpan data) {
    if (number == 0 || number > maxPartCount_) {
        return makeError(ErrorCode::kInvalidArgument,
                         fmt::format("part number {} out of range 1..{}", number, maxPartCount_));
    }

    {
        std::lock_guard lock(stagingMutex_);
        std::error_code ec;
        std::filesystem::create_directories(stagingDirectory(), ec);
        if (ec) {
            return makeError(errorFromSystem(
                ec, fmt::format("create {}", stagingDirectory().string())));
        }
    }

    const auto target = partPath(number);
    std::ofstream stream(target, std::ios::binary | std::ios::trunc);
    if (!stream) {
        return makeError(ErrorCode::kIOError, fmt::format("cannot create {}", target.string()));
    }
    stream.write(reinterpret_cast<const char*>(data.data()),
                 static_cast<std::streamsize>(data.size()));
    stream.close();
    if (!stream) {
        return makeError(ErrorCode::kIOError, fmt::format("write failed on {}", target.string()));
    }
    return core::PartToken{number, contentTag(data), data.size()};
}

VoidResult FileObject::completeUpload(const std::vector<core::PartToken>& tokens) {
    if (tokens.empty()) {
        return makeError(ErrorCode::kInvalidArgument,
                         fmt::format("complete {} without parts", name()));
    }

    const auto staging = stagingDirectory();
    const auto assembled = staging / kCompleteName;
    {
        std::ofstream out(assembled, std::ios::binary | std::ios::trunc);
        if (!out) {
            return makeError(ErrorCode::kIOError,
                             fmt::format("cannot create {}", assembled.string()));
        }

        PartNumber previous = 0;
        ByteBuffer buffer;
        for (const auto& token : tokens) {
            if (token.number <= previous) {
                return makeError(ErrorCode::kInvalidArgument,
                                 fmt::format("parts of {} out of order at {}", name(),
                                             token.number));
            }
            previous = token.number;

            const auto source = partPath(token.number);
            std::error_code ec;
            const auto partSize = std::filesystem::file_size(source, ec);
            if (ec) {
                return makeError(ErrorCode::kInvalidArgument,
                                 fmt::format("unknown part {} of {}", token.number, name()));
            }

            std::ifstream in(source, std::ios::binary);
            buffer.resize(static_cast<std::size_t>(partSize));
            in.read(reinterpret_cast<char*>(buffer.data()),
                    static_cast<std::streamsize>(buffer.size()));
            if (!in || contentTag(ByteSpan(buffer)) != token.etag) {
                return makeError(ErrorCode::kInvalidArgument,
                                 fmt::format("part {} of {} does not match its token",
                                             token.number, name()));
            }
            out.write(reinterpret_cast<const char*>(buffer.data()),
                      static_cast<std::streamsize>(buffer.size()));
        }
        out.close();
        if (!out) {
            return makeError(ErrorCode::kIOError,
                             fmt::format("write failed on {}", assembled.string()));
        }
    }

    std::error_code ec;
    std::filesystem::rename(assembled, path_, ec);
    if (ec) {
        return makeError(errorFromSystem(ec, fmt::format("commit {}", name())));
    }

    std::lock_guard lock(stagingMutex_);
    std::filesystem::remove_all(staging, ec);
    if (ec) {
        REMIO_LOG_WARNING("cannot remove staging directory {}: {}", staging.string(),
                          ec.message());
    }
    return makeVoidSuccess();
}

VoidResult FileObject::abortUpload() {
    std::lock_guard lock(stagingMutex_);
    std::error_code ec;
    std::filesystem::remove_all(stagingDirectory(), ec);
    if (ec) {
        return makeError(errorFromSystem(
            ec, fmt::format("remove {}", stagingDirectory().string())));
    }
    return makeVoidSuccess();
}

}  // namespace remio::backend
