#pragma once

#include "davdrive/core/byte_stream.hpp"
#include "davdrive/driver/driver_config.hpp"
#include "davdrive/driver/metrics.hpp"
#include "davdrive/storage/backend.hpp"
#include "davdrive/storage/chunked_upload.hpp"
#include "davdrive/storage/remote_store_adapter.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace davdrive {

// Storage driver contract exposed to the host
class StorageDriver {
public:
    virtual ~StorageDriver() = default;

    virtual std::unique_ptr<ByteStream> read(const std::string& filepath,
                                             const ReadOptions& options = {}) = 0;
    virtual FileMetadata stat(const std::string& filepath) = 0;
    virtual bool exists(const std::string& filepath) = 0;
    virtual void move(const std::string& source, const std::string& destination) = 0;
    virtual void copy(const std::string& source, const std::string& destination) = 0;
    virtual void write(const std::string& filepath, ByteStream& content) = 0;
    virtual void remove(const std::string& filepath) = 0;
    virtual FileListing list(const std::string& prefix = "") = 0;
};

// Resumable-upload contract
class ChunkedUploadDriver {
public:
    virtual ~ChunkedUploadDriver() = default;

    virtual std::vector<std::string> tus_extensions() const = 0;

    virtual ChunkedUploadContext create_chunked_upload(const std::string& filepath,
                                                       const ChunkedUploadContext& context) = 0;

    // Returns the new total size of the upload
    virtual uint64_t write_chunk(const std::string& filepath,
                                 ByteStream& content,
                                 uint64_t offset,
                                 const ChunkedUploadContext& context) = 0;

    virtual void finish_chunked_upload(const std::string& filepath,
                                       const ChunkedUploadContext& context) = 0;

    virtual void delete_chunked_upload(const std::string& filepath,
                                       const ChunkedUploadContext& context) = 0;
};

// Opens the bytes [offset, offset + length) of the local source
using ChunkSource = std::function<std::unique_ptr<ByteStream>(uint64_t offset, uint64_t length)>;

// Run a whole resumable upload of `total` bytes in chunks of `chunk_size`.
// A chunk that does not move the upload forward (the source came up short)
// fails it with std::runtime_error. On any failure the partial upload is
// deleted and the error rethrown. Returns the final size.
uint64_t upload_in_chunks(ChunkedUploadDriver& driver,
                          const std::string& filepath,
                          const ChunkedUploadContext& context,
                          uint64_t total,
                          uint64_t chunk_size,
                          const ChunkSource& open_chunk);

// Driver over a WebDAV (or file://) remote store, scoped to config.root.
// Operations are counted into `metrics` when one is given; it must outlive the driver.
class WebDavDriver : public StorageDriver {
public:
    explicit WebDavDriver(const DriverConfig& config, MetricsExporter* metrics = nullptr);

    // Use an existing store instead of creating one from config.base_url
    WebDavDriver(const DriverConfig& config,
                 std::shared_ptr<RemoteStore> store,
                 MetricsExporter* metrics = nullptr);

    std::unique_ptr<ByteStream> read(const std::string& filepath,
                                     const ReadOptions& options = {}) override;
    FileMetadata stat(const std::string& filepath) override;
    bool exists(const std::string& filepath) override;
    void move(const std::string& source, const std::string& destination) override;
    void copy(const std::string& source, const std::string& destination) override;
    void write(const std::string& filepath, ByteStream& content) override;
    void remove(const std::string& filepath) override;
    FileListing list(const std::string& prefix = "") override;

    const DriverConfig& config() const { return config_; }

protected:
    // Run `fn`, recording its outcome and duration under `op`
    template <typename Fn>
    auto instrument(const char* op, Fn&& fn) -> decltype(fn());

    const DriverConfig config_;
    std::shared_ptr<RemoteStoreAdapter> adapter_;
    MetricsExporter* metrics_;
};

// WebDavDriver with emulated resumable uploads
class WebDavTusDriver : public WebDavDriver, public ChunkedUploadDriver {
public:
    explicit WebDavTusDriver(const DriverConfig& config, MetricsExporter* metrics = nullptr);
    WebDavTusDriver(const DriverConfig& config,
                    std::shared_ptr<RemoteStore> store,
                    MetricsExporter* metrics = nullptr);

    std::vector<std::string> tus_extensions() const override;

    ChunkedUploadContext create_chunked_upload(const std::string& filepath,
                                               const ChunkedUploadContext& context) override;
    uint64_t write_chunk(const std::string& filepath,
                         ByteStream& content,
                         uint64_t offset,
                         const ChunkedUploadContext& context) override;
    void finish_chunked_upload(const std::string& filepath,
                               const ChunkedUploadContext& context) override;
    void delete_chunked_upload(const std::string& filepath,
                               const ChunkedUploadContext& context) override;

private:
    ChunkedUploadEmulator uploads_;
};

}  // namespace davdrive
