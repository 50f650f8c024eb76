#include "davdrive/storage/backend.hpp"
#include "davdrive/core/constants.hpp"
#include "davdrive/core/error.hpp"
#include "davdrive/core/log.hpp"
#include "davdrive/net/http.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <fstream>
#include <functional>
#include <mutex>
#include <shared_mutex>
#include <stdexcept>
#include <system_error>

namespace davdrive {

// ============================================================================
// Shared helpers
// ============================================================================

std::vector<uint8_t> to_bytes(FileContents&& contents) {
    if (auto* bytes = std::get_if<std::vector<uint8_t>>(&contents)) {
        return std::move(*bytes);
    }
    const auto& text = std::get<std::string>(contents);
    return std::vector<uint8_t>(text.begin(), text.end());
}

std::optional<AuthType> parse_auth_type(const std::string& name) {
    if (name == "auto") return AuthType::Auto;
    if (name == "basic") return AuthType::Basic;
    if (name == "digest") return AuthType::Digest;
    if (name == "none") return AuthType::None;
    return std::nullopt;
}

const char* auth_type_to_string(AuthType type) {
    switch (type) {
        case AuthType::Auto: return "auto";
        case AuthType::Basic: return "basic";
        case AuthType::Digest: return "digest";
        case AuthType::None: return "none";
    }
    return "auto";
}

// Defined in webdav_store.cpp
std::unique_ptr<RemoteStore> make_webdav_store(const RemoteStoreOptions& options);

// ============================================================================
// LocalRemoteStore - File system implementation
// ============================================================================

namespace {

constexpr const char* TEMP_MARKER = ".davdrive-tmp.";

// Parse "bytes=start-end" / "bytes=start-"
bool parse_range_header(const std::string& value, uint64_t& start, std::optional<uint64_t>& end) {
    if (!value.starts_with("bytes=")) return false;
    auto bounds = value.substr(6);
    auto dash = bounds.find('-');
    if (dash == std::string::npos || dash == 0) return false;
    try {
        start = std::stoull(bounds.substr(0, dash));
        auto end_str = bounds.substr(dash + 1);
        end = end_str.empty() ? std::nullopt : std::optional<uint64_t>(std::stoull(end_str));
    } catch (const std::exception&) {
        return false;
    }
    return !end || *end >= start;
}

class LocalRemoteStore : public RemoteStore {
public:
    explicit LocalRemoteStore(const std::filesystem::path& root)
        : root_(std::filesystem::absolute(root).lexically_normal()) {
        if (root_.has_parent_path() && root_.filename().empty()) {
            root_ = root_.parent_path();
        }
        std::filesystem::create_directories(root_);
        log_debug("Local store rooted at %s", root_.c_str());
    }

    std::string type_name() const override { return "local"; }

    Response<RemoteStat> stat(const std::string& path) const override {
        auto& shard = get_shard(path);
        std::shared_lock lock(shard.mutex);

        auto local = to_local(path);
        std::error_code ec;
        auto status = std::filesystem::status(local, ec);
        if (ec || !std::filesystem::exists(status)) {
            throw RemoteError("Not found: " + path, 404);
        }
        return make_stat(local);
    }

    std::unique_ptr<ByteStream> create_read_stream(
        const std::string& path,
        const std::map<std::string, std::string>& headers) const override {
        auto& shard = get_shard(path);
        std::shared_lock lock(shard.mutex);

        auto local = to_local(path);
        if (!std::filesystem::is_regular_file(local)) {
            throw RemoteError("Not found: " + path, 404);
        }

        uint64_t file_size = std::filesystem::file_size(local);
        uint64_t start = 0;
        std::optional<uint64_t> length;

        for (const auto& [name, value] : headers) {
            std::string lower = name;
            std::transform(lower.begin(), lower.end(), lower.begin(),
                           [](unsigned char c) { return std::tolower(c); });
            if (lower != "range") continue;

            std::optional<uint64_t> end;
            if (!parse_range_header(value, start, end)) {
                throw RemoteError("Invalid range for " + path + ": " + value, 416);
            }
            if (start > file_size) {
                throw RemoteError("Range start beyond file size: " + path, 416);
            }
            if (end) {
                uint64_t last = std::min(*end + 1, file_size);  // exclusive
                length = last > start ? last - start : 0;
            }
        }

        return std::make_unique<FileStream>(local, start, length);
    }

    Response<FileContents> get_file_contents(const std::string& path,
                                             ContentFormat format) const override {
        auto& shard = get_shard(path);
        std::shared_lock lock(shard.mutex);

        auto local = to_local(path);
        std::ifstream file(local, std::ios::binary | std::ios::ate);
        if (!file || !std::filesystem::is_regular_file(local)) {
            throw RemoteError("Not found: " + path, 404);
        }

        auto tellg_val = file.tellg();
        if (tellg_val < 0) {
            throw RemoteError("Cannot determine file size: " + path, 500);
        }

        std::vector<uint8_t> data(static_cast<size_t>(tellg_val));
        file.seekg(0);
        file.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(data.size()));
        if (!file) {
            throw RemoteError("Failed to read file: " + path, 500);
        }

        if (format == ContentFormat::Text) {
            return FileContents{std::string(data.begin(), data.end())};
        }
        return FileContents{std::move(data)};
    }

    void put_file_contents(const std::string& path, std::span<const uint8_t> data) override {
        MemoryStream stream(std::vector<uint8_t>(data.begin(), data.end()));
        put_file_stream(path, stream);
    }

    void put_file_stream(const std::string& path, ByteStream& stream) override {
        auto& shard = get_shard(path);
        std::unique_lock lock(shard.mutex);

        auto local = to_local(path);
        if (std::filesystem::is_directory(local)) {
            throw RemoteError("Is a directory: " + path, 409);
        }

        // Create parent directories
        std::filesystem::create_directories(local.parent_path());

        // Write to temp file then rename (atomic)
        auto temp_path = local.string() + TEMP_MARKER +
            std::to_string(std::chrono::steady_clock::now().time_since_epoch().count());

        {
            std::ofstream file(temp_path, std::ios::binary);
            if (!file) {
                throw RemoteError("Failed to create file: " + path, 500);
            }
            try {
                copy_stream(stream, file);
            } catch (const std::exception&) {
                file.close();
                std::error_code ignored;
                std::filesystem::remove(temp_path, ignored);
                throw;
            }
        }

        std::error_code ec;
        std::filesystem::rename(temp_path, local, ec);
        if (ec) {
            std::error_code ignored;
            std::filesystem::remove(temp_path, ignored);
            throw RemoteError("Failed to rename file " + path + ": " + ec.message(), 500);
        }
    }

    void move_file(const std::string& source, const std::string& destination) override {
        std::unique_lock lock(global_mutex_);

        auto src_path = to_local(source);
        auto dst_path = to_local(destination);
        if (!std::filesystem::exists(src_path)) {
            throw RemoteError("Not found: " + source, 404);
        }

        std::filesystem::create_directories(dst_path.parent_path());

        std::error_code ec;
        std::filesystem::rename(src_path, dst_path, ec);
        if (ec) {
            throw RemoteError("Failed to move " + source + " to " + destination + ": " +
                              ec.message(), 500);
        }
    }

    void copy_file(const std::string& source, const std::string& destination) override {
        std::unique_lock lock(global_mutex_);

        auto src_path = to_local(source);
        auto dst_path = to_local(destination);
        if (!std::filesystem::exists(src_path)) {
            throw RemoteError("Not found: " + source, 404);
        }

        std::filesystem::create_directories(dst_path.parent_path());

        std::error_code ec;
        std::filesystem::copy(src_path, dst_path,
            std::filesystem::copy_options::overwrite_existing |
            std::filesystem::copy_options::recursive, ec);
        if (ec) {
            throw RemoteError("Failed to copy " + source + " to " + destination + ": " +
                              ec.message(), 500);
        }
    }

    void delete_file(const std::string& path) override {
        auto& shard = get_shard(path);
        std::unique_lock lock(shard.mutex);

        auto local = to_local(path);
        if (local == root_) {
            throw RemoteError("Refusing to delete the store root", 403);
        }

        std::error_code ec;
        auto removed = std::filesystem::remove_all(local, ec);
        if (ec) {
            throw RemoteError("Failed to delete " + path + ": " + ec.message(), 500);
        }
        if (removed == 0) {
            throw RemoteError("Not found: " + path, 404);
        }
    }

    Response<std::vector<DirectoryEntry>> get_directory_contents(
        const std::string& path, bool deep) const override {
        // Listing requires global lock since it scans across all shards
        std::shared_lock lock(global_mutex_);

        auto local = to_local(path);
        if (!std::filesystem::is_directory(local)) {
            throw RemoteError("Not found: " + path, 404);
        }

        std::vector<DirectoryEntry> entries;
        auto add = [&](const std::filesystem::directory_entry& entry) {
            if (entry.path().filename().string().find(TEMP_MARKER) != std::string::npos) {
                return;
            }
            entries.push_back(make_stat(entry.path()));
        };

        if (deep) {
            for (const auto& entry : std::filesystem::recursive_directory_iterator(local)) {
                add(entry);
            }
        } else {
            for (const auto& entry : std::filesystem::directory_iterator(local)) {
                add(entry);
            }
        }

        std::sort(entries.begin(), entries.end(),
                  [](const DirectoryEntry& a, const DirectoryEntry& b) {
                      return a.filename < b.filename;
                  });
        return entries;
    }

private:
    std::filesystem::path root_;

    struct Shard {
        mutable std::shared_mutex mutex;
    };
    mutable std::array<Shard, constants::CHUNK_LOCK_SHARDS> shards_;

    // Whole-tree operations (listing, move, copy)
    mutable std::shared_mutex global_mutex_;

    // Get shard for a path using hash
    Shard& get_shard(const std::string& path) const {
        size_t hash = std::hash<std::string>{}(path);
        return shards_[hash % shards_.size()];
    }

    std::filesystem::path to_local(const std::string& path) const {
        std::string rel = path;
        while (!rel.empty() && rel.front() == '/') {
            rel.erase(0, 1);
        }

        auto result = (root_ / rel).lexically_normal();

        // Keep every path under root_
        auto relative = result.lexically_relative(root_);
        if (relative.empty() || *relative.begin() == "..") {
            throw RemoteError("Path escapes the store root: " + path, 403);
        }

        // Trailing slashes leave an empty final component
        if (result.has_parent_path() && result.filename().empty()) {
            result = result.parent_path();
        }
        return result;
    }

    RemoteStat make_stat(const std::filesystem::path& local) const {
        RemoteStat st;

        auto rel = local.lexically_relative(root_).generic_string();
        if (rel == ".") rel.clear();
        st.filename = "/" + rel;
        st.basename = local.filename().string();

        if (std::filesystem::is_directory(local)) {
            st.type = EntryType::Directory;
        } else {
            st.type = EntryType::File;
            st.size = std::filesystem::file_size(local);
            st.mime = "application/octet-stream";
        }

        auto ftime = std::filesystem::last_write_time(local);
        auto sctp = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
            std::chrono::file_clock::to_sys(ftime));
        st.lastmod = net::format_http_date(sctp);
        return st;
    }
};

} // namespace

// ============================================================================
// RemoteStoreFactory implementation
// ============================================================================

std::unique_ptr<RemoteStore> RemoteStoreFactory::create(const RemoteStoreOptions& options) {
    auto url = net::ParsedUrl::parse(options.base_url);
    if (!url) {
        throw std::invalid_argument("Invalid base URL: " + options.base_url);
    }

    if (url->scheme == "file") {
        if (url->path.empty()) {
            throw std::invalid_argument("file:// base URL requires a path");
        }
        return create_local(net::url_decode(url->path));
    }

    if (url->scheme == "http" || url->scheme == "https") {
        return create_webdav(options);
    }

    throw std::invalid_argument("Unsupported base URL scheme: " + url->scheme);
}

std::unique_ptr<RemoteStore> RemoteStoreFactory::create_webdav(const RemoteStoreOptions& options) {
    return make_webdav_store(options);
}

std::unique_ptr<RemoteStore> RemoteStoreFactory::create_local(
    const std::filesystem::path& root_path) {
    return std::make_unique<LocalRemoteStore>(root_path);
}

} // namespace davdrive
