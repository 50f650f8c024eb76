#pragma once

#include "davdrive/core/byte_stream.hpp"
#include "davdrive/core/constants.hpp"
#include "davdrive/storage/remote_store_adapter.hpp"

#include <array>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace davdrive {

// Host-owned upload state, passed through untouched
struct ChunkedUploadContext {
    std::optional<uint64_t> size;
    std::map<std::string, std::string> metadata;
};

// Resumable uploads on a store that can only replace whole objects.
// Every chunk is a read-modify-write of the backing object, which holds all
// upload state. Concurrent chunks for one path race unless serialize_writes
// is set, and even then only within this process.
class ChunkedUploadEmulator {
public:
    explicit ChunkedUploadEmulator(std::shared_ptr<RemoteStoreAdapter> adapter,
                                   bool serialize_writes = false);

    // Advertised resumable-upload extensions
    static std::vector<std::string> extensions();

    // Write an empty object at `path`; returns the context unchanged
    ChunkedUploadContext create(const std::string& path, const ChunkedUploadContext& context);

    // Overwrite from `offset` with the whole chunk, dropping anything after it.
    // Returns the resulting object size.
    uint64_t write_chunk(const std::string& path,
                         ByteStream& content,
                         uint64_t offset,
                         const ChunkedUploadContext& context);

    void finish(const std::string& path, const ChunkedUploadContext& context);

    // Delete the backing object
    void remove(const std::string& path, const ChunkedUploadContext& context);

    bool serialize_writes() const { return serialize_writes_; }

private:
    // Keyed by remote path, so every spelling of one object shares a lock
    std::mutex& lock_for(const std::string& remote_path);

    std::shared_ptr<RemoteStoreAdapter> adapter_;
    bool serialize_writes_;
    std::array<std::mutex, constants::CHUNK_LOCK_SHARDS> locks_;
};

} // namespace davdrive
