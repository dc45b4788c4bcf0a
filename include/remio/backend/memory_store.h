// =============================================================================
// remio - In-Memory Backend
// =============================================================================
// Thread-safe in-process object store. MemoryStore owns the committed
// objects; MemoryObject is the RemoteObject handle for one name, with its own
// multipart staging area. Version tags are xxHash64 digests of the content.
// =============================================================================

#ifndef REMIO_BACKEND_MEMORY_STORE_H
#define REMIO_BACKEND_MEMORY_STORE_H

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "remio/common/error.h"
#include "remio/common/types.h"
#include "remio/core/backend.h"

namespace remio::backend {

class MemoryObject;

class MemoryStore {
public:
    MemoryStore();

    /// @brief Store @p data under @p name, replacing any previous content.
    void put(const std::string& name, ByteBuffer data);

    /// @brief Content of @p name, or nullopt if absent.
    [[nodiscard]] std::optional<ByteBuffer> get(const std::string& name) const;

    /// @brief Version tag of @p name, or nullopt if absent.
    [[nodiscard]] std::optional<std::string> version(const std::string& name) const;

    [[nodiscard]] bool contains(const std::string& name) const;

    /// @return true if an object was removed.
    bool remove(const std::string& name);

    [[nodiscard]] std::size_t objectCount() const;

    /// @brief Handle for reading or uploading @p name.
    [[nodiscard]] std::shared_ptr<MemoryObject> open(
        const std::string& name, PartNumber maxPartCount = kDefaultMaxPartCount);

private:
    friend class MemoryObject;

    struct StoredObject {
        ByteBuffer data;
        std::string version;
    };

    struct Contents {
        mutable std::mutex mutex;
        std::map<std::string, StoredObject> objects;
    };

    std::shared_ptr<Contents> contents_;
};

class MemoryObject : public core::RemoteObject {
public:
    [[nodiscard]] std::string name() const override { return "memory://" + name_; }

    [[nodiscard]] Result<core::RangeResult> fetchRange(std::uint64_t offset,
                                                       std::uint64_t length) override;

    [[nodiscard]] Result<std::optional<std::uint64_t>> objectSize() override;

    [[nodiscard]] Result<core::PartToken> putPart(PartNumber number, ByteSpan data) override;

    [[nodiscard]] VoidResult completeUpload(const std::vector<core::PartToken>& tokens) override;

    [[nodiscard]] VoidResult abortUpload() override;

    [[nodiscard]] PartNumber maxPartCount() const override { return maxPartCount_; }

    /// @brief Parts uploaded and not yet committed or aborted.
    [[nodiscard]] std::size_t stagedParts() const;

private:
    friend class MemoryStore;

    MemoryObject(std::shared_ptr<MemoryStore::Contents> contents, std::string name,
                 PartNumber maxPartCount);

    std::shared_ptr<MemoryStore::Contents> contents_;
    std::string name_;
    PartNumber maxPartCount_;

    mutable std::mutex stagingMutex_;
    std::map<PartNumber, core::PartToken> stagedTokens_;
    std::map<PartNumber, ByteBuffer> stagedData_;
};

}  // namespace remio::backend

#endif  // REMIO_BACKEND_MEMORY_STORE_H
