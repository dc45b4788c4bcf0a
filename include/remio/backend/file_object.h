// =============================================================================
// remio - Local File Backend
// =============================================================================
// RemoteObject over a local file.
//
// Ranges are read from the file directly. Uploaded parts are staged as
// separate files in a sibling "<path>.remio-upload/" directory; completing
// the upload concatenates them in token order into a temporary file that is
// then renamed over the target, so readers never observe a partial object.
// Aborting removes the staging directory.
//
// The version tag combines modification time and size, so rewriting the
// file while a reader is open is detected.
// =============================================================================

#ifndef REMIO_BACKEND_FILE_OBJECT_H
#define REMIO_BACKEND_FILE_OBJECT_H

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include "remio/common/error.h"
#include "remio/common/types.h"
#include "remio/core/backend.h"

namespace remio::backend {

class FileObject : public core::RemoteObject {
public:
    explicit FileObject(std::filesystem::path path,
                        PartNumber maxPartCount = kDefaultMaxPartCount);

    [[nodiscard]] std::string name() const override { return path_.string(); }

    [[nodiscard]] Result<core::RangeResult> fetchRange(std::uint64_t offset,
                                                       std::uint64_t length) override;

    [[nodiscard]] Result<std::optional<std::uint64_t>> objectSize() override;

    [[nodiscard]] Result<core::PartToken> putPart(PartNumber number, ByteSpan data) override;

    [[nodiscard]] VoidResult completeUpload(const std::vector<core::PartToken>& tokens) override;

    [[nodiscard]] VoidResult abortUpload() override;

    [[nodiscard]] PartNumber maxPartCount() const override { return maxPartCount_; }

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    /// @brief Directory holding staged parts of the current upload.
    [[nodiscard]] std::filesystem::path stagingDirectory() const;

private:
    [[nodiscard]] std::filesystem::path partPath(PartNumber number) const;
    [[nodiscard]] Result<std::string> currentVersion() const;

    std::filesystem::path path_;
    PartNumber maxPartCount_;

    /// @brief Serializes staging directory creation and removal.
    std::mutex stagingMutex_;
};

/// @brief Map a filesystem error to the engine's error codes.
[[nodiscard]] Error errorFromSystem(std::error_code ec, std::string message);

}  // namespace remio::backend

#endif  // REMIO_BACKEND_FILE_OBJECT_H
