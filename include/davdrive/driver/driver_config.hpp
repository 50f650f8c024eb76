#pragma once

#include "davdrive/core/constants.hpp"
#include "davdrive/storage/backend.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace davdrive {

/// Configuration for a WebDAV driver instance.
/// Treated as immutable once a driver has been constructed from it.
struct DriverConfig {
    // Remote store
    std::string base_url;   // http(s)://host/dav/ or file:///local/dir
    std::string username;   // Falls back to DAVDRIVE_USERNAME
    std::string password;   // Falls back to DAVDRIVE_PASSWORD
    std::string root = constants::DEFAULT_ROOT;  // Every path is scoped under this directory

    // Transport
    std::string auth_type = constants::DEFAULT_AUTH_TYPE;  // auto, basic, digest, none
    bool verify_ssl = true;
    std::string ca_cert_path;
    uint32_t connect_timeout_secs = constants::DEFAULT_CONNECT_TIMEOUT_SECONDS;
    uint32_t request_timeout_secs = constants::DEFAULT_REQUEST_TIMEOUT_SECONDS;

    // Serialize write_chunk calls per path within this process
    bool serialize_chunk_writes = false;

    bool verbose = false;

    // Prometheus metrics (textfile collector)
    std::filesystem::path metrics_file;
    size_t metrics_interval_secs = constants::DEFAULT_METRICS_INTERVAL_SECONDS;

    /// Parse configuration from command line arguments.
    /// Non-option arguments are appended to `positional`; without it they are an error.
    /// Returns empty optional on error (prints usage to stderr).
    static std::optional<DriverConfig> from_args(int argc, char* argv[],
                                                 std::vector<std::string>* positional = nullptr);

    /// Load configuration from a JSON file, overlaying onto current values.
    bool load_json(const std::filesystem::path& path);

    /// Fill in defaults (root).
    void apply_defaults();

    /// Validate required fields. Returns error message or empty string.
    std::string validate() const;

    /// Connection settings for RemoteStoreFactory.
    RemoteStoreOptions store_options() const;
};

}  // namespace davdrive
