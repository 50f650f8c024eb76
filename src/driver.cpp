#include "davdrive/driver/driver.hpp"
#include "davdrive/core/log.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

namespace davdrive {

namespace {

std::shared_ptr<RemoteStore> create_store(const DriverConfig& config) {
    auto err = config.validate();
    if (!err.empty()) {
        throw std::invalid_argument("Invalid driver configuration: " + err);
    }
    return RemoteStoreFactory::create(config.store_options());
}

std::shared_ptr<RemoteStore> require_store(std::shared_ptr<RemoteStore> store) {
    if (!store) {
        throw std::invalid_argument("WebDavDriver requires a remote store");
    }
    return store;
}

// Counts bytes as they are pulled through to the store
class CountingStream : public ByteStream {
public:
    explicit CountingStream(ByteStream& inner) : inner_(inner) {}

    size_t read(std::span<uint8_t> buffer) override {
        size_t n = inner_.read(buffer);
        count_ += n;
        return n;
    }

    uint64_t count() const { return count_; }

private:
    ByteStream& inner_;
    uint64_t count_ = 0;
};

}  // namespace

// ============================================================================
// WebDavDriver
// ============================================================================

WebDavDriver::WebDavDriver(const DriverConfig& config, MetricsExporter* metrics)
    : WebDavDriver(config, create_store(config), metrics) {}

WebDavDriver::WebDavDriver(const DriverConfig& config,
                           std::shared_ptr<RemoteStore> store,
                           MetricsExporter* metrics)
    : config_(config)
    , adapter_(std::make_shared<RemoteStoreAdapter>(require_store(std::move(store)),
                                                    PathNormalizer(config.root)))
    , metrics_(metrics) {
    log_debug("Driver on %s store, root %s",
              adapter_->store().type_name().c_str(), config_.root.c_str());
}

template <typename Fn>
auto WebDavDriver::instrument(const char* op, Fn&& fn) -> decltype(fn()) {
    if (!metrics_) {
        return fn();
    }

    ScopedTimer timer(metrics_->operation_duration(op));
    try {
        if constexpr (std::is_void_v<decltype(fn())>) {
            fn();
            metrics_->record_operation(op, true);
        } else {
            auto result = fn();
            metrics_->record_operation(op, true);
            return result;
        }
    } catch (const std::exception&) {
        metrics_->record_operation(op, false);
        throw;
    }
}

std::unique_ptr<ByteStream> WebDavDriver::read(const std::string& filepath,
                                               const ReadOptions& options) {
    return instrument("read", [&] { return adapter_->read(filepath, options); });
}

FileMetadata WebDavDriver::stat(const std::string& filepath) {
    return instrument("stat", [&] { return adapter_->stat(filepath); });
}

bool WebDavDriver::exists(const std::string& filepath) {
    return instrument("exists", [&] { return adapter_->exists(filepath); });
}

void WebDavDriver::move(const std::string& source, const std::string& destination) {
    instrument("move", [&] { adapter_->move(source, destination); });
}

void WebDavDriver::copy(const std::string& source, const std::string& destination) {
    instrument("copy", [&] { adapter_->copy(source, destination); });
}

void WebDavDriver::write(const std::string& filepath, ByteStream& content) {
    instrument("write", [&] { adapter_->write(filepath, content); });
}

void WebDavDriver::remove(const std::string& filepath) {
    instrument("delete", [&] { adapter_->remove(filepath); });
}

FileListing WebDavDriver::list(const std::string& prefix) {
    return instrument("list", [&] { return adapter_->list(prefix); });
}

// ============================================================================
// WebDavTusDriver
// ============================================================================

WebDavTusDriver::WebDavTusDriver(const DriverConfig& config, MetricsExporter* metrics)
    : WebDavDriver(config, metrics)
    , uploads_(adapter_, config.serialize_chunk_writes) {}

WebDavTusDriver::WebDavTusDriver(const DriverConfig& config,
                                 std::shared_ptr<RemoteStore> store,
                                 MetricsExporter* metrics)
    : WebDavDriver(config, std::move(store), metrics)
    , uploads_(adapter_, config.serialize_chunk_writes) {}

std::vector<std::string> WebDavTusDriver::tus_extensions() const {
    return ChunkedUploadEmulator::extensions();
}

ChunkedUploadContext WebDavTusDriver::create_chunked_upload(const std::string& filepath,
                                                            const ChunkedUploadContext& context) {
    return instrument("create_chunked_upload", [&] { return uploads_.create(filepath, context); });
}

uint64_t WebDavTusDriver::write_chunk(const std::string& filepath,
                                      ByteStream& content,
                                      uint64_t offset,
                                      const ChunkedUploadContext& context) {
    return instrument("write_chunk", [&] {
        if (!metrics_) {
            return uploads_.write_chunk(filepath, content, offset, context);
        }
        CountingStream counted(content);
        auto size = uploads_.write_chunk(filepath, counted, offset, context);
        metrics_->chunk_bytes_total().Increment(static_cast<double>(counted.count()));
        return size;
    });
}

void WebDavTusDriver::finish_chunked_upload(const std::string& filepath,
                                            const ChunkedUploadContext& context) {
    instrument("finish_chunked_upload", [&] { uploads_.finish(filepath, context); });
}

void WebDavTusDriver::delete_chunked_upload(const std::string& filepath,
                                            const ChunkedUploadContext& context) {
    instrument("delete_chunked_upload", [&] { uploads_.remove(filepath, context); });
}

// ============================================================================
// Whole-file uploads
// ============================================================================

uint64_t upload_in_chunks(ChunkedUploadDriver& driver,
                          const std::string& filepath,
                          const ChunkedUploadContext& context,
                          uint64_t total,
                          uint64_t chunk_size,
                          const ChunkSource& open_chunk) {
    if (chunk_size == 0) {
        throw std::invalid_argument("Chunk size must be positive");
    }

    auto upload = driver.create_chunked_upload(filepath, context);
    uint64_t offset = 0;
    try {
        while (offset < total) {
            auto chunk = open_chunk(offset, std::min(chunk_size, total - offset));
            uint64_t next = driver.write_chunk(filepath, *chunk, offset, upload);
            if (next <= offset) {
                throw std::runtime_error("Upload of " + filepath + " stalled at byte " +
                                         std::to_string(offset) + " of " + std::to_string(total));
            }
            offset = next;
            log_debug("Uploaded %llu/%llu bytes of %s",
                      static_cast<unsigned long long>(offset),
                      static_cast<unsigned long long>(total), filepath.c_str());
        }
        driver.finish_chunked_upload(filepath, upload);
    } catch (const std::exception& e) {
        log_error("Upload of %s failed: %s", filepath.c_str(), e.what());
        try {
            driver.delete_chunked_upload(filepath, upload);
        } catch (const std::exception& cleanup) {
            log_error("Failed to delete partial upload %s: %s", filepath.c_str(), cleanup.what());
        }
        throw;
    }
    return offset;
}

}  // namespace davdrive
