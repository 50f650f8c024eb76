#include "davdrive/storage/chunked_upload.hpp"
#include "davdrive/core/log.hpp"

#include <algorithm>
#include <functional>
#include <utility>

namespace davdrive {

ChunkedUploadEmulator::ChunkedUploadEmulator(std::shared_ptr<RemoteStoreAdapter> adapter,
                                             bool serialize_writes)
    : adapter_(std::move(adapter))
    , serialize_writes_(serialize_writes) {}

std::vector<std::string> ChunkedUploadEmulator::extensions() {
    return {constants::TUS_EXTENSION_CREATION,
            constants::TUS_EXTENSION_TERMINATION,
            constants::TUS_EXTENSION_EXPIRATION};
}

ChunkedUploadContext ChunkedUploadEmulator::create(const std::string& path,
                                                   const ChunkedUploadContext& context) {
    adapter_->write_contents(path, {});
    log_debug("Created chunked upload %s", path.c_str());
    return context;
}

uint64_t ChunkedUploadEmulator::write_chunk(const std::string& path,
                                            ByteStream& content,
                                            uint64_t offset,
                                            const ChunkedUploadContext& /*context*/) {
    std::unique_lock<std::mutex> lock;
    if (serialize_writes_) {
        lock = std::unique_lock<std::mutex>(lock_for(adapter_->paths().normalize(path)));
    }

    auto data = adapter_->read_contents(path);
    auto chunk = read_all(content);

    // Overwrite from offset; an offset past the end appends without padding
    auto keep = static_cast<size_t>(std::min<uint64_t>(offset, data.size()));
    data.resize(keep);
    data.insert(data.end(), chunk.begin(), chunk.end());

    adapter_->write_contents(path, data);

    log_debug("Wrote %zu bytes at offset %llu to %s (now %zu bytes)",
              chunk.size(), static_cast<unsigned long long>(offset), path.c_str(), data.size());
    return data.size();
}

void ChunkedUploadEmulator::finish(const std::string& /*path*/,
                                   const ChunkedUploadContext& /*context*/) {
    // Every chunk already replaced the whole object
}

void ChunkedUploadEmulator::remove(const std::string& path,
                                   const ChunkedUploadContext& /*context*/) {
    adapter_->remove(path);
}

std::mutex& ChunkedUploadEmulator::lock_for(const std::string& remote_path) {
    size_t hash = std::hash<std::string>{}(remote_path);
    return locks_[hash % locks_.size()];
}

} // namespace davdrive
