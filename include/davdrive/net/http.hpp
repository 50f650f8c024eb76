#pragma once

#include "davdrive/core/byte_stream.hpp"
#include "davdrive/core/constants.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace davdrive::net {

// HTTP methods, including the WebDAV verbs the store needs
enum class HttpMethod {
    GET,
    PUT,
    DELETE,
    PROPFIND,
    MOVE,
    COPY
};

const char* http_method_to_string(HttpMethod method);

bool is_success_status(int status);

// HTTP headers (case-insensitive)
class HttpHeaders {
public:
    void set(const std::string& name, const std::string& value);
    void add(const std::string& name, const std::string& value);

    std::optional<std::string> get(const std::string& name) const;
    std::vector<std::string> get_all(const std::string& name) const;
    bool has(const std::string& name) const;

    // Iteration
    using HeaderPair = std::pair<std::string, std::string>;
    std::vector<HeaderPair> all() const;

    // Common headers
    void set_content_type(const std::string& content_type);
    void set_basic_auth(const std::string& username, const std::string& password);

private:
    // Headers stored as lowercase name -> values
    std::map<std::string, std::vector<std::string>> headers_;

    static std::string normalize_name(const std::string& name);
};

// Pulls request body bytes for streamed uploads.
// Fills at most `size` bytes and returns the count; 0 ends the body.
using HttpBodyReader = std::function<size_t(uint8_t* buffer, size_t size)>;

// HTTP request
struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    HttpHeaders headers;
    std::vector<uint8_t> body;

    // When set, the body is pulled from here and sent with chunked
    // transfer encoding instead of `body`. Such a request cannot be replayed.
    HttpBodyReader body_reader;

    // Timeouts; zero uses the client defaults
    std::chrono::milliseconds connect_timeout{0};
    std::chrono::milliseconds total_timeout{0};

    // SSL options
    bool verify_ssl = true;
    std::string ca_bundle_path;  // Empty = system default

    bool replayable() const { return !body_reader; }

    // Convenience constructors
    static HttpRequest make(HttpMethod method, const std::string& url);
    static HttpRequest get(const std::string& url);

    // Set XML body
    void set_xml_body(const std::string& xml);
};

// HTTP response
struct HttpResponse {
    int status_code = 0;
    HttpHeaders headers;
    std::vector<uint8_t> body;

    // Convenience methods
    bool ok() const { return is_success_status(status_code); }
    std::string body_string() const;

    // Error info (for failed requests)
    std::string error;
    bool is_network_error = false;  // True if error was network-level, not HTTP status
};

// Response whose body is pulled incrementally from the connection.
// Status and headers are available once the stream has been opened.
// read() throws RemoteError if the transfer fails mid-body.
class HttpResponseStream : public ByteStream {
public:
    virtual int status_code() const = 0;
    virtual const HttpHeaders& headers() const = 0;

    // Non-empty when the transfer failed before a status was received
    virtual const std::string& error() const = 0;

    // Drain the remaining body as text (used for error reporting)
    std::string drain_string();
};

// HTTP client configuration
// Pool size and timeouts can be overridden via environment variables:
//   DAVDRIVE_CONNECTION_POOL_SIZE - Connections per host (default: 10)
//   DAVDRIVE_REQUEST_TIMEOUT - Request timeout in seconds (default: 60)
// The environment wins over values set here.
struct HttpClientConfig {
    // Connection pooling
    size_t max_connections_per_host = 10;
    size_t max_total_connections = 100;

    // Default timeouts
    std::chrono::milliseconds default_connect_timeout{
        std::chrono::seconds(constants::DEFAULT_CONNECT_TIMEOUT_SECONDS)};
    std::chrono::milliseconds default_total_timeout{
        std::chrono::seconds(constants::DEFAULT_REQUEST_TIMEOUT_SECONDS)};

    // Buffered response size limit (0 = unlimited). Streams are not limited.
    size_t max_response_size = 1024ULL * 1024 * 1024;

    // SSL
    bool verify_ssl_by_default = true;
    std::string default_ca_bundle;

    // User agent
    std::string user_agent = "davdrive/1.0";

    // Verbose logging (for debugging)
    bool verbose = false;
};

// Read DAVDRIVE_CONNECTION_POOL_SIZE and DAVDRIVE_REQUEST_TIMEOUT into `config`.
// Out-of-range or malformed values are reported and ignored.
void apply_environment_overrides(HttpClientConfig& config);

// Limits for one transfer. Zero disables a limit.
struct TransferTimeouts {
    std::chrono::milliseconds connect{0};
    std::chrono::milliseconds total{0};
    // Abort once less than one byte per second has moved for this long
    std::chrono::seconds stall{0};
};

// Request values win over the client defaults. Streamed transfers (open_stream
// and body_reader uploads) can outlast the request timeout, so they get the
// stall guard instead of a total limit.
TransferTimeouts resolve_timeouts(const HttpRequest& request,
                                  const HttpClientConfig& config,
                                  bool streamed);

// HTTP client with connection pooling. Never retries.
class HttpClient {
public:
    explicit HttpClient(const HttpClientConfig& config = {});
    ~HttpClient();

    // Non-copyable, movable
    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;
    HttpClient(HttpClient&&) noexcept;
    HttpClient& operator=(HttpClient&&) noexcept;

    // Synchronous request with a buffered response body.
    // Rethrows any exception raised by the request's body reader.
    HttpResponse execute(const HttpRequest& request);

    // Start a request and return its body as a stream
    std::unique_ptr<HttpResponseStream> open_stream(const HttpRequest& request);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

// HTTP Digest authentication (RFC 7616), qop "auth", MD5 or SHA-256.
// Keeps the last server challenge and a nonce counter; thread-safe.
class DigestAuthSigner {
public:
    DigestAuthSigner(const std::string& username, const std::string& password);

    // Parse a WWW-Authenticate header value.
    // Returns false (and keeps the previous challenge) if it is not a Digest
    // challenge or names an algorithm other than MD5 or SHA-256 (plain or -sess).
    bool update_challenge(const std::string& www_authenticate);

    bool has_challenge() const;

    // Build the Authorization header value for one request, using the given
    // client nonce. Increments the nonce count.
    std::string authorization(const std::string& method,
                              const std::string& uri,
                              const std::string& cnonce);

    // Sign a request with a freshly generated client nonce
    void sign(HttpRequest& request);

private:
    std::string username_;
    std::string password_;

    mutable std::mutex mutex_;
    std::string realm_;
    std::string nonce_;
    std::string opaque_;
    std::string algorithm_ = "MD5";  // As the server spelled it
    bool sha256_ = false;
    bool session_ = false;
    std::string qop_;
    uint32_t nonce_count_ = 0;
    bool has_challenge_ = false;
};

// URL parsing helper
struct ParsedUrl {
    std::string scheme;   // http, https, file
    std::string host;
    int port = 0;         // 0 = default for scheme
    std::string path;
    std::string query;
    std::string fragment;
    std::string userinfo; // user:password

    static std::optional<ParsedUrl> parse(const std::string& url);
};

// URL encoding/decoding
std::string url_encode(const std::string& str);
std::string url_encode_path(const std::string& path);  // Keeps '/' separators
std::string url_decode(const std::string& str);

// Base64 encoding (for Basic auth)
std::string base64_encode(const std::vector<uint8_t>& data);
std::string base64_encode(const std::string& str);

// HTTP dates. Parsing accepts RFC 1123 ("Tue, 05 Mar 2024 10:00:00 GMT")
// and ISO 8601 ("2024-03-05T10:00:00Z").
std::optional<std::chrono::system_clock::time_point> parse_http_date(const std::string& value);
std::string format_http_date(std::chrono::system_clock::time_point time);

} // namespace davdrive::net
