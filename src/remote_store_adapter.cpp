#include "davdrive/storage/remote_store_adapter.hpp"
#include "davdrive/core/log.hpp"
#include "davdrive/net/http.hpp"

#include <map>
#include <utility>

namespace davdrive {

std::string range_header(const ReadRange& range) {
    std::string value = "bytes=" + std::to_string(range.start) + "-";
    if (range.end) {
        value += std::to_string(*range.end);
    }
    return value;
}

// ============================================================================
// FileListing
// ============================================================================

FileListing::FileListing(std::vector<std::string> paths)
    : paths_(std::move(paths)) {}

std::optional<std::string> FileListing::next() {
    if (pos_ >= paths_.size()) {
        return std::nullopt;
    }
    return std::move(paths_[pos_++]);
}

FileListing::iterator::iterator(FileListing* listing)
    : listing_(listing)
    , current_(listing->next()) {}

FileListing::iterator& FileListing::iterator::operator++() {
    current_ = listing_ ? listing_->next() : std::nullopt;
    return *this;
}

// ============================================================================
// RemoteStoreAdapter
// ============================================================================

RemoteStoreAdapter::RemoteStoreAdapter(std::shared_ptr<RemoteStore> store, PathNormalizer paths)
    : store_(std::move(store))
    , paths_(std::move(paths)) {}

std::unique_ptr<ByteStream> RemoteStoreAdapter::read(const std::string& path,
                                                     const ReadOptions& options) const {
    std::map<std::string, std::string> headers;
    if (options.range) {
        headers["Range"] = range_header(*options.range);
    }
    return store_->create_read_stream(paths_.normalize(path), headers);
}

FileMetadata RemoteStoreAdapter::stat(const std::string& path) const {
    auto st = unwrap(store_->stat(paths_.normalize(path)));

    FileMetadata meta;
    meta.size = st.size.value_or(0);
    meta.modified = std::chrono::system_clock::now();

    if (st.lastmod) {
        if (auto parsed = net::parse_http_date(*st.lastmod)) {
            meta.modified = *parsed;
        } else {
            log_debug("Unparseable lastmod '%s' for %s", st.lastmod->c_str(), path.c_str());
        }
    }
    return meta;
}

bool RemoteStoreAdapter::exists(const std::string& path) const {
    try {
        stat(path);
        return true;
    } catch (const std::exception& e) {
        log_debug("exists(%s): %s", path.c_str(), e.what());
        return false;
    }
}

void RemoteStoreAdapter::move(const std::string& source, const std::string& destination) {
    store_->move_file(paths_.normalize(source), paths_.normalize(destination));
}

void RemoteStoreAdapter::copy(const std::string& source, const std::string& destination) {
    store_->copy_file(paths_.normalize(source), paths_.normalize(destination));
}

void RemoteStoreAdapter::write(const std::string& path, ByteStream& content) {
    store_->put_file_stream(paths_.normalize(path), content);
}

void RemoteStoreAdapter::remove(const std::string& path) {
    store_->delete_file(paths_.normalize(path));
}

FileListing RemoteStoreAdapter::list(const std::string& prefix) const {
    auto entries = unwrap(store_->get_directory_contents(paths_.normalize(prefix), true));

    std::vector<std::string> files;
    for (const auto& entry : entries) {
        if (!entry.is_file()) continue;
        files.push_back(paths_.denormalize(entry.filename));
    }
    return FileListing(std::move(files));
}

std::vector<uint8_t> RemoteStoreAdapter::read_contents(const std::string& path) const {
    return to_bytes(unwrap(store_->get_file_contents(paths_.normalize(path), ContentFormat::Binary)));
}

void RemoteStoreAdapter::write_contents(const std::string& path, std::span<const uint8_t> data) {
    store_->put_file_contents(paths_.normalize(path), data);
}

} // namespace davdrive
