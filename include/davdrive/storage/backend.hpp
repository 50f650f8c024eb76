#pragma once

#include "davdrive/core/byte_stream.hpp"
#include "davdrive/core/constants.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace davdrive {

enum class EntryType {
    File,
    Directory
};

// Stat result / directory entry as reported by a remote store
struct RemoteStat {
    std::string filename;                // Absolute remote path
    std::string basename;
    EntryType type = EntryType::File;
    std::optional<uint64_t> size;        // Absent when the store did not report it
    std::optional<std::string> lastmod;  // Raw date string as reported
    std::string etag;
    std::string mime;

    bool is_file() const { return type == EntryType::File; }
};

using DirectoryEntry = RemoteStat;

// Response wrapped with transport details
template <typename T>
struct Envelope {
    T data;
    int status = 200;
    std::map<std::string, std::string> headers;
};

// A store answers either with the bare value or with an envelope around it
template <typename T>
using Response = std::variant<Envelope<T>, T>;

template <typename T>
T unwrap(Response<T>&& response) {
    if (auto* envelope = std::get_if<Envelope<T>>(&response)) {
        return std::move(envelope->data);
    }
    return std::get<T>(std::move(response));
}

enum class ContentFormat {
    Binary,
    Text
};

// Whole-file payload: bytes for binary reads, a string for text reads
using FileContents = std::variant<std::vector<uint8_t>, std::string>;

std::vector<uint8_t> to_bytes(FileContents&& contents);

// Abstract interface for remote hierarchical stores.
// Paths are absolute remote paths ("/dir/file"). Failures throw RemoteError.
class RemoteStore {
public:
    virtual ~RemoteStore() = default;

    // Get the store type name (for logging/debugging)
    virtual std::string type_name() const = 0;

    virtual Response<RemoteStat> stat(const std::string& path) const = 0;

    // Open the object for streaming. `headers` are forwarded with the
    // request (e.g. Range).
    virtual std::unique_ptr<ByteStream> create_read_stream(
        const std::string& path,
        const std::map<std::string, std::string>& headers = {}) const = 0;

    virtual Response<FileContents> get_file_contents(
        const std::string& path,
        ContentFormat format = ContentFormat::Binary) const = 0;

    // Replace the whole object
    virtual void put_file_contents(const std::string& path,
                                   std::span<const uint8_t> data) = 0;

    // Replace the whole object with everything the stream yields
    virtual void put_file_stream(const std::string& path, ByteStream& stream) = 0;

    virtual void move_file(const std::string& source, const std::string& destination) = 0;
    virtual void copy_file(const std::string& source, const std::string& destination) = 0;
    virtual void delete_file(const std::string& path) = 0;

    // Entries below `path`, excluding `path` itself. `deep` walks the whole subtree.
    virtual Response<std::vector<DirectoryEntry>> get_directory_contents(
        const std::string& path,
        bool deep = false) const = 0;
};

enum class AuthType {
    Auto,    // Basic until the server issues a Digest challenge
    Basic,
    Digest,
    None
};

std::optional<AuthType> parse_auth_type(const std::string& name);
const char* auth_type_to_string(AuthType type);

// Connection settings for a remote store
struct RemoteStoreOptions {
    std::string base_url;  // http(s):// for WebDAV, file:// for a local directory
    std::string username;
    std::string password;
    AuthType auth = AuthType::Auto;
    bool verify_ssl = true;
    std::string ca_cert_path;
    uint32_t connect_timeout_secs = constants::DEFAULT_CONNECT_TIMEOUT_SECONDS;
    uint32_t request_timeout_secs = constants::DEFAULT_REQUEST_TIMEOUT_SECONDS;
    bool verbose = false;
};

// Factory for creating remote stores from configuration
class RemoteStoreFactory {
public:
    // Pick the implementation from the base URL scheme
    static std::unique_ptr<RemoteStore> create(const RemoteStoreOptions& options);

    // Create a WebDAV store
    static std::unique_ptr<RemoteStore> create_webdav(const RemoteStoreOptions& options);

    // Create a store backed by a local directory
    static std::unique_ptr<RemoteStore> create_local(const std::filesystem::path& root_path);
};

} // namespace davdrive
