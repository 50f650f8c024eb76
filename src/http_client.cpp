#include "davdrive/net/http.hpp"
#include "davdrive/core/constants.hpp"
#include "davdrive/core/error.hpp"
#include "davdrive/core/log.hpp"
#include <curl/curl.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <exception>
#include <iomanip>
#include <iostream>
#include <locale>
#include <memory>
#include <mutex>
#include <sstream>

namespace davdrive::net {

// ============================================================================
// Environment-based configuration helpers
// ============================================================================

// Get connection pool size from environment or use default
static size_t get_connection_pool_size() {
    if (const char* env = std::getenv("DAVDRIVE_CONNECTION_POOL_SIZE")) {
        try {
            size_t size = std::stoul(env);
            // Sanity check: at least 1, at most 1000
            if (size >= 1 && size <= 1000) {
                return size;
            }
            std::cerr << "warning: DAVDRIVE_CONNECTION_POOL_SIZE=" << env
                      << " out of range [1,1000], using default\n";
        } catch (const std::exception&) {
            std::cerr << "warning: invalid DAVDRIVE_CONNECTION_POOL_SIZE=" << env
                      << ", using default\n";
        }
    }
    return constants::DEFAULT_CONNECTION_POOL_SIZE;
}

// Get request timeout from environment, if set
static std::optional<std::chrono::seconds> get_request_timeout() {
    if (const char* env = std::getenv("DAVDRIVE_REQUEST_TIMEOUT")) {
        try {
            unsigned long secs = std::stoul(env);
            // Sanity check: at least 5 seconds, at most 1 hour
            if (secs >= 5 && secs <= 3600) {
                return std::chrono::seconds(secs);
            }
            std::cerr << "warning: DAVDRIVE_REQUEST_TIMEOUT=" << env
                      << " out of range [5,3600], using default\n";
        } catch (const std::exception&) {
            std::cerr << "warning: invalid DAVDRIVE_REQUEST_TIMEOUT=" << env
                      << ", using default\n";
        }
    }
    return std::nullopt;
}

void apply_environment_overrides(HttpClientConfig& config) {
    if (std::getenv("DAVDRIVE_CONNECTION_POOL_SIZE")) {
        size_t pool_size = get_connection_pool_size();
        config.max_connections_per_host = pool_size;
        config.max_total_connections = pool_size * 10;
    }
    if (auto timeout = get_request_timeout()) {
        config.default_total_timeout = *timeout;
    }
}

TransferTimeouts resolve_timeouts(const HttpRequest& request,
                                  const HttpClientConfig& config,
                                  bool streamed) {
    TransferTimeouts limits;
    limits.connect = request.connect_timeout.count() > 0
        ? request.connect_timeout : config.default_connect_timeout;
    auto total = request.total_timeout.count() > 0
        ? request.total_timeout : config.default_total_timeout;

    if (!streamed) {
        limits.total = total;
    } else if (total.count() > 0) {
        limits.stall = std::max(std::chrono::seconds(1),
                                std::chrono::ceil<std::chrono::seconds>(total));
    }
    return limits;
}

// ============================================================================
// Utility functions
// ============================================================================

const char* http_method_to_string(HttpMethod method) {
    switch (method) {
        case HttpMethod::GET: return "GET";
        case HttpMethod::PUT: return "PUT";
        case HttpMethod::DELETE: return "DELETE";
        case HttpMethod::PROPFIND: return "PROPFIND";
        case HttpMethod::MOVE: return "MOVE";
        case HttpMethod::COPY: return "COPY";
    }
    return "GET";
}

bool is_success_status(int status) {
    return status >= 200 && status < 300;
}

std::string url_encode(const std::string& str) {
    static constexpr char hex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(str.size());
    for (unsigned char c : str) {
        if (std::isalnum(c) || (c != 0 && std::strchr("-_.~", c) != nullptr)) {
            out += static_cast<char>(c);
            continue;
        }
        out += '%';
        out += hex[c >> 4];
        out += hex[c & 0x0F];
    }
    return out;
}

std::string url_encode_path(const std::string& path) {
    std::string result;
    result.reserve(path.size());

    size_t pos = 0;
    while (pos <= path.size()) {
        size_t slash = path.find('/', pos);
        if (slash == std::string::npos) {
            result += url_encode(path.substr(pos));
            break;
        }
        result += url_encode(path.substr(pos, slash - pos));
        result += '/';
        pos = slash + 1;
    }

    return result;
}

static int hex_value(char c) {
    if (std::isdigit(static_cast<unsigned char>(c))) return c - '0';
    char lower = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (lower >= 'a' && lower <= 'f') return lower - 'a' + 10;
    return -1;
}

// Percent-decoding for URL paths. '+' stays a literal plus, malformed
// escapes are copied through and %00 is dropped.
std::string url_decode(const std::string& str) {
    std::string out;
    out.reserve(str.size());
    size_t i = 0;
    while (i < str.size()) {
        int hi = -1;
        int lo = -1;
        if (str[i] == '%' && i + 2 < str.size()) {
            hi = hex_value(str[i + 1]);
            lo = hex_value(str[i + 2]);
        }
        if (hi < 0 || lo < 0) {
            out += str[i++];
            continue;
        }
        char decoded = static_cast<char>((hi << 4) | lo);
        if (decoded != '\0') out += decoded;
        i += 3;
    }
    return out;
}

std::string base64_encode(const std::vector<uint8_t>& data) {
    if (data.empty()) return {};
    std::string out(4 * ((data.size() + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                  data.data(), static_cast<int>(data.size()));
    out.resize(written > 0 ? static_cast<size_t>(written) : 0);
    return out;
}

std::string base64_encode(const std::string& str) {
    return base64_encode(std::vector<uint8_t>(str.begin(), str.end()));
}

// ============================================================================
// HTTP dates
// ============================================================================

std::optional<std::chrono::system_clock::time_point> parse_http_date(const std::string& value) {
    if (value.empty()) return std::nullopt;

    std::tm tm{};
    long offset_seconds = 0;

    std::istringstream iss(value);
    iss.imbue(std::locale::classic());

    if (value.find(',') != std::string::npos) {
        // RFC 1123: "Tue, 05 Mar 2024 10:00:00 GMT"
        iss >> std::get_time(&tm, "%a, %d %b %Y %H:%M:%S");
        if (iss.fail()) return std::nullopt;
    } else {
        // ISO 8601: "2024-03-05T10:00:00Z", "2024-03-05T10:00:00.123+02:00"
        iss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
        if (iss.fail()) return std::nullopt;

        if (iss.peek() == '.') {
            iss.get();
            while (std::isdigit(iss.peek())) iss.get();
        }
        int c = iss.peek();
        if (c == '+' || c == '-') {
            iss.get();
            int hours = 0;
            int minutes = 0;
            char colon = 0;
            iss >> std::setw(2) >> hours;
            if (iss.peek() == ':') iss >> colon;
            iss >> std::setw(2) >> minutes;
            if (iss.fail()) return std::nullopt;
            offset_seconds = (hours * 3600L + minutes * 60L) * (c == '+' ? 1 : -1);
        }
    }

    time_t t = timegm(&tm);
    if (t == static_cast<time_t>(-1)) return std::nullopt;
    return std::chrono::system_clock::from_time_t(t - offset_seconds);
}

std::string format_http_date(std::chrono::system_clock::time_point time) {
    time_t t = std::chrono::system_clock::to_time_t(time);
    std::tm tm{};
    gmtime_r(&t, &tm);

    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss << std::put_time(&tm, "%a, %d %b %Y %H:%M:%S GMT");
    return oss.str();
}

// ============================================================================
// HttpHeaders
// ============================================================================

std::string HttpHeaders::normalize_name(const std::string& name) {
    std::string result = name;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

void HttpHeaders::set(const std::string& name, const std::string& value) {
    std::string key = normalize_name(name);
    headers_[key] = {value};
}

void HttpHeaders::add(const std::string& name, const std::string& value) {
    std::string key = normalize_name(name);
    headers_[key].push_back(value);
}

std::optional<std::string> HttpHeaders::get(const std::string& name) const {
    auto it = headers_.find(normalize_name(name));
    if (it != headers_.end() && !it->second.empty()) {
        return it->second[0];
    }
    return std::nullopt;
}

std::vector<std::string> HttpHeaders::get_all(const std::string& name) const {
    auto it = headers_.find(normalize_name(name));
    if (it != headers_.end()) {
        return it->second;
    }
    return {};
}

bool HttpHeaders::has(const std::string& name) const {
    return headers_.find(normalize_name(name)) != headers_.end();
}

std::vector<HttpHeaders::HeaderPair> HttpHeaders::all() const {
    std::vector<HeaderPair> result;
    for (const auto& [name, values] : headers_) {
        for (const auto& value : values) {
            result.emplace_back(name, value);
        }
    }
    return result;
}

void HttpHeaders::set_content_type(const std::string& content_type) {
    set("Content-Type", content_type);
}

void HttpHeaders::set_basic_auth(const std::string& username, const std::string& password) {
    set("Authorization", "Basic " + base64_encode(username + ":" + password));
}

// ============================================================================
// HttpRequest / HttpResponse
// ============================================================================

HttpRequest HttpRequest::make(HttpMethod method, const std::string& url) {
    HttpRequest req;
    req.method = method;
    req.url = url;
    return req;
}

HttpRequest HttpRequest::get(const std::string& url) {
    return make(HttpMethod::GET, url);
}

void HttpRequest::set_xml_body(const std::string& xml) {
    body = std::vector<uint8_t>(xml.begin(), xml.end());
    headers.set_content_type("application/xml; charset=utf-8");
}

std::string HttpResponse::body_string() const {
    return std::string(body.begin(), body.end());
}

std::string HttpResponseStream::drain_string() {
    auto bytes = read_all(*this);
    return std::string(bytes.begin(), bytes.end());
}

// ============================================================================
// ParsedUrl
// ============================================================================

namespace {

struct CurlUrlDeleter {
    void operator()(CURLU* handle) const { curl_url_cleanup(handle); }
};

std::string url_part(CURLU* handle, CURLUPart part) {
    char* value = nullptr;
    if (curl_url_get(handle, part, &value, 0) != CURLUE_OK || value == nullptr) {
        return {};
    }
    std::string result(value);
    curl_free(value);
    return result;
}

}  // namespace

std::optional<ParsedUrl> ParsedUrl::parse(const std::string& url) {
    std::unique_ptr<CURLU, CurlUrlDeleter> handle(curl_url());
    if (!handle) return std::nullopt;

    const unsigned int flags = CURLU_NON_SUPPORT_SCHEME | CURLU_PATH_AS_IS | CURLU_ALLOW_SPACE;
    if (curl_url_set(handle.get(), CURLUPART_URL, url.c_str(), flags) != CURLUE_OK) {
        return std::nullopt;
    }

    ParsedUrl result;
    result.scheme = url_part(handle.get(), CURLUPART_SCHEME);
    result.host = url_part(handle.get(), CURLUPART_HOST);
    if (result.host.size() > 1 && result.host.front() == '[' && result.host.back() == ']') {
        result.host = result.host.substr(1, result.host.size() - 2);
    }
    std::string port = url_part(handle.get(), CURLUPART_PORT);
    if (!port.empty()) {
        result.port = std::atoi(port.c_str());
    }
    result.path = url_part(handle.get(), CURLUPART_PATH);
    result.query = url_part(handle.get(), CURLUPART_QUERY);
    result.fragment = url_part(handle.get(), CURLUPART_FRAGMENT);

    std::string user = url_part(handle.get(), CURLUPART_USER);
    std::string password = url_part(handle.get(), CURLUPART_PASSWORD);
    result.userinfo = password.empty() ? user : user + ":" + password;
    return result;
}

// ============================================================================
// CURL callback functions
// ============================================================================

// Context for bounded response accumulation
struct WriteCallbackContext {
    std::vector<uint8_t>* response;
    size_t max_size;
    size_t current_size;
    bool size_exceeded;
};

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<WriteCallbackContext*>(userdata);
    size_t bytes = size * nmemb;

    // Check if adding this data would exceed the limit
    if (ctx->max_size > 0 && ctx->current_size + bytes > ctx->max_size) {
        ctx->size_exceeded = true;
        return 0;  // Return 0 to signal error and abort transfer
    }

    ctx->response->insert(ctx->response->end(), ptr, ptr + bytes);
    ctx->current_size += bytes;
    return bytes;
}

static size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* headers = static_cast<HttpHeaders*>(userdata);
    size_t bytes = size * nitems;

    std::string line(buffer, bytes);

    // Remove trailing CRLF
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.pop_back();
    }

    // A new status line starts a new header block (redirects, 100-continue)
    if (line.starts_with("HTTP/")) {
        *headers = HttpHeaders{};
        return bytes;
    }
    if (line.empty()) {
        return bytes;
    }

    // Parse header
    size_t colon = line.find(':');
    if (colon != std::string::npos) {
        std::string name = line.substr(0, colon);
        std::string value = line.substr(colon + 1);

        // Trim leading whitespace from value
        size_t start = value.find_first_not_of(" \t");
        if (start != std::string::npos) {
            value = value.substr(start);
        }

        headers->add(name, value);
    }

    return bytes;
}

// Streamed request bodies: exceptions cannot cross the C callback, so they
// are parked here and rethrown once curl_easy_perform returns.
struct BodyReaderContext {
    const HttpBodyReader* reader;
    std::exception_ptr error;
};

static size_t body_reader_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* ctx = static_cast<BodyReaderContext*>(userdata);
    try {
        return (*ctx->reader)(reinterpret_cast<uint8_t*>(buffer), size * nitems);
    } catch (...) {
        ctx->error = std::current_exception();
        return CURL_READFUNC_ABORT;
    }
}

// ============================================================================
// CurlResponseStream - body pulled through a private multi handle
// ============================================================================

class CurlResponseStream : public HttpResponseStream {
public:
    CurlResponseStream(CURL* easy, struct curl_slist* request_headers)
        : easy_(easy)
        , request_headers_(request_headers)
        , high_watermark_(constants::DEFAULT_STREAM_BUFFER_SIZE * 4) {
        if (!easy_) {
            error_ = "Failed to create CURL handle";
            done_ = true;
            return;
        }

        curl_easy_setopt(easy_, CURLOPT_WRITEFUNCTION, &CurlResponseStream::on_data);
        curl_easy_setopt(easy_, CURLOPT_WRITEDATA, this);
        curl_easy_setopt(easy_, CURLOPT_HEADERFUNCTION, header_callback);
        curl_easy_setopt(easy_, CURLOPT_HEADERDATA, &headers_);

        multi_ = curl_multi_init();
        if (!multi_) {
            error_ = "Failed to create CURL multi handle";
            done_ = true;
            return;
        }
        curl_multi_add_handle(multi_, easy_);
    }

    ~CurlResponseStream() override {
        if (multi_) {
            if (easy_) curl_multi_remove_handle(multi_, easy_);
            curl_multi_cleanup(multi_);
        }
        if (easy_) curl_easy_cleanup(easy_);
        if (request_headers_) curl_slist_free_all(request_headers_);
    }

    CurlResponseStream(const CurlResponseStream&) = delete;
    CurlResponseStream& operator=(const CurlResponseStream&) = delete;

    // Drive the transfer until the first body bytes arrive or it ends
    void start() {
        while (pending_pos_ == pending_.size() && !done_) {
            pump();
        }
        refresh_status();
    }

    int status_code() const override { return status_code_; }
    const HttpHeaders& headers() const override { return headers_; }
    const std::string& error() const override { return error_; }

    size_t read(std::span<uint8_t> buffer) override {
        while (pending_pos_ == pending_.size() && !done_) {
            if (paused_) {
                paused_ = false;
                curl_easy_pause(easy_, CURLPAUSE_CONT);
                continue;
            }
            pump();
        }

        size_t available = pending_.size() - pending_pos_;
        if (available == 0) {
            if (!error_.empty()) {
                throw RemoteError("Transfer failed: " + error_, status_code_, true);
            }
            return 0;
        }

        size_t n = std::min(available, buffer.size());
        std::memcpy(buffer.data(), pending_.data() + pending_pos_, n);
        pending_pos_ += n;

        if (pending_pos_ == pending_.size()) {
            pending_.clear();
            pending_pos_ = 0;
        }

        if (paused_ && pending_.size() - pending_pos_ < high_watermark_) {
            paused_ = false;
            curl_easy_pause(easy_, CURLPAUSE_CONT);
        }
        return n;
    }

private:
    static size_t on_data(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* self = static_cast<CurlResponseStream*>(userdata);
        size_t bytes = size * nmemb;

        // Bound the read-ahead: curl redelivers this data after unpausing
        if (self->pending_.size() - self->pending_pos_ >= self->high_watermark_) {
            self->paused_ = true;
            return CURL_WRITEFUNC_PAUSE;
        }

        self->pending_.insert(self->pending_.end(), ptr, ptr + bytes);
        return bytes;
    }

    void pump() {
        int running = 0;
        CURLMcode mc = curl_multi_perform(multi_, &running);
        if (mc != CURLM_OK) {
            error_ = curl_multi_strerror(mc);
            done_ = true;
            return;
        }

        if (running == 0) {
            finish();
            return;
        }

        int numfds = 0;
        mc = curl_multi_wait(multi_, nullptr, 0, 1000, &numfds);
        if (mc != CURLM_OK) {
            error_ = curl_multi_strerror(mc);
            done_ = true;
        }
    }

    void finish() {
        CURLMsg* msg;
        int msgs_left;
        CURLcode result = CURLE_OK;
        while ((msg = curl_multi_info_read(multi_, &msgs_left))) {
            if (msg->msg == CURLMSG_DONE) {
                result = msg->data.result;
            }
        }
        if (result != CURLE_OK) {
            error_ = curl_easy_strerror(result);
        }
        done_ = true;
        refresh_status();
    }

    void refresh_status() {
        if (!easy_) return;
        long code = 0;
        curl_easy_getinfo(easy_, CURLINFO_RESPONSE_CODE, &code);
        status_code_ = static_cast<int>(code);
    }

    CURL* easy_ = nullptr;
    CURLM* multi_ = nullptr;
    struct curl_slist* request_headers_ = nullptr;

    HttpHeaders headers_;
    std::vector<uint8_t> pending_;
    size_t pending_pos_ = 0;
    size_t high_watermark_;

    bool paused_ = false;
    bool done_ = false;
    int status_code_ = 0;
    std::string error_;
};

// ============================================================================
// HttpClient Implementation
// ============================================================================

class HttpClient::Impl {
public:
    explicit Impl(const HttpClientConfig& config)
        : config_(config) {
        // Initialize CURL globally (thread-safe)
        static std::once_flag curl_init_flag;
        std::call_once(curl_init_flag, []() {
            curl_global_init(CURL_GLOBAL_ALL);
        });

        apply_environment_overrides(config_);
    }

    ~Impl() {
        std::lock_guard<std::mutex> lock(pool_mutex_);
        for (CURL* handle : idle_handles_) {
            curl_easy_cleanup(handle);
        }
        idle_handles_.clear();
    }

private:
    // Idle handle from the pool, or a new one while under the connection limit
    CURL* acquire_handle() {
        std::lock_guard<std::mutex> lock(pool_mutex_);

        CURL* handle = nullptr;
        if (!idle_handles_.empty()) {
            handle = idle_handles_.back();
            idle_handles_.pop_back();
        } else if (active_handles_ < config_.max_total_connections) {
            handle = curl_easy_init();
        }
        if (handle) {
            ++active_handles_;
        }
        return handle;
    }

    void release_handle(CURL* handle) {
        if (!handle) return;

        std::lock_guard<std::mutex> lock(pool_mutex_);
        --active_handles_;
        curl_easy_reset(handle);

        if (idle_handles_.size() < config_.max_connections_per_host) {
            idle_handles_.push_back(handle);
        } else {
            curl_easy_cleanup(handle);
        }
    }

    // Options shared by buffered and streamed requests.
    // Returns the header list, which the caller must free after the transfer.
    struct curl_slist* configure_handle(CURL* curl, const HttpRequest& request, bool streamed) {
        // URL
        curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());

        // Method
        switch (request.method) {
            case HttpMethod::GET:
                curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
                break;
            case HttpMethod::PUT:
                curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);
                break;
            case HttpMethod::DELETE:
            case HttpMethod::PROPFIND:
            case HttpMethod::MOVE:
            case HttpMethod::COPY:
                curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, http_method_to_string(request.method));
                break;
        }

        // Headers
        struct curl_slist* headers_list = nullptr;
        for (const auto& [name, value] : request.headers.all()) {
            std::string header = name + ": " + value;
            headers_list = curl_slist_append(headers_list, header.c_str());
        }
        if (headers_list) {
            curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers_list);
        }

        // User agent
        if (!config_.user_agent.empty()) {
            curl_easy_setopt(curl, CURLOPT_USERAGENT, config_.user_agent.c_str());
        }

        // Timeouts. Time a paused stream spends waiting on its reader is not a stall.
        auto limits = resolve_timeouts(request, config_, streamed);
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                         static_cast<long>(limits.connect.count()));
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS,
                         static_cast<long>(limits.total.count()));
        if (limits.stall.count() > 0) {
            curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
            curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME,
                             static_cast<long>(limits.stall.count()));
        }

        // SSL options
        bool ssl_verify_enabled = request.verify_ssl && config_.verify_ssl_by_default;
        if (!ssl_verify_enabled) {
            static std::once_flag ssl_warning_flag;
            std::call_once(ssl_warning_flag, []() {
                std::cerr << "SECURITY WARNING: SSL verification disabled via configuration.\n"
                          << "This exposes connections to man-in-the-middle attacks.\n";
            });
        }

        if (ssl_verify_enabled) {
            curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
            curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
        } else {
            curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 0L);
            curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 0L);
        }

        if (!request.ca_bundle_path.empty()) {
            curl_easy_setopt(curl, CURLOPT_CAINFO, request.ca_bundle_path.c_str());
        } else if (!config_.default_ca_bundle.empty()) {
            curl_easy_setopt(curl, CURLOPT_CAINFO, config_.default_ca_bundle.c_str());
        }

        // Follow redirects
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);

        // Verbose
        if (config_.verbose) {
            curl_easy_setopt(curl, CURLOPT_VERBOSE, 1L);
        }

        return headers_list;
    }

public:

    HttpResponse execute(const HttpRequest& request) {
        HttpResponse response;

        // Acquire handle from pool
        CURL* curl = acquire_handle();
        if (!curl) {
            response.error = "Failed to acquire connection from pool";
            response.is_network_error = true;
            return response;
        }

        struct curl_slist* headers_list =
            configure_handle(curl, request, static_cast<bool>(request.body_reader));

        // Request body. Buffered PUT bodies go through the same reader as
        // streamed ones so that an empty PUT still carries Content-Length: 0.
        size_t body_pos = 0;
        HttpBodyReader buffered_reader = [&request, &body_pos](uint8_t* buffer, size_t size) {
            size_t n = std::min(size, request.body.size() - body_pos);
            if (n > 0) {
                std::memcpy(buffer, request.body.data() + body_pos, n);
                body_pos += n;
            }
            return n;
        };
        BodyReaderContext reader_ctx{
            request.body_reader ? &request.body_reader : &buffered_reader, nullptr};

        if (request.body_reader || request.method == HttpMethod::PUT) {
            curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);
            curl_easy_setopt(curl, CURLOPT_READFUNCTION, body_reader_callback);
            curl_easy_setopt(curl, CURLOPT_READDATA, &reader_ctx);
            if (!request.body_reader) {
                curl_easy_setopt(curl, CURLOPT_INFILESIZE_LARGE,
                                 static_cast<curl_off_t>(request.body.size()));
            }
        } else if (!request.body.empty()) {
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.data());
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                             static_cast<curl_off_t>(request.body.size()));
        }

        // Response callbacks with bounded size
        std::vector<uint8_t> response_body;
        WriteCallbackContext write_ctx{&response_body, config_.max_response_size, 0, false};
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &write_ctx);

        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);

        CURLcode res = curl_easy_perform(curl);

        if (res == CURLE_OK && !write_ctx.size_exceeded) {
            long code = 0;
            curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);
            response.status_code = static_cast<int>(code);

            response.body = std::move(response_body);
        } else if (write_ctx.size_exceeded) {
            response.error = "Response body exceeded maximum size limit of " +
                             std::to_string(config_.max_response_size) + " bytes";
            response.is_network_error = false;
            response.status_code = 413;  // Payload Too Large
        } else {
            response.error = curl_easy_strerror(res);
            response.is_network_error = true;
        }

        if (headers_list) {
            curl_slist_free_all(headers_list);
        }
        release_handle(curl);

        if (reader_ctx.error) {
            std::rethrow_exception(reader_ctx.error);
        }

        return response;
    }

    std::unique_ptr<HttpResponseStream> open_stream(const HttpRequest& request) {
        if (!request.body.empty() || request.body_reader) {
            throw std::invalid_argument("open_stream does not send request bodies");
        }

        // Streams own their handle for their whole lifetime, outside the pool
        CURL* curl = curl_easy_init();
        struct curl_slist* headers_list = curl ? configure_handle(curl, request, true) : nullptr;

        auto stream = std::make_unique<CurlResponseStream>(curl, headers_list);
        stream->start();
        return stream;
    }

private:
    HttpClientConfig config_;

    // Connection pool
    mutable std::mutex pool_mutex_;
    std::vector<CURL*> idle_handles_;
    size_t active_handles_ = 0;
};

// ============================================================================
// HttpClient public interface
// ============================================================================

HttpClient::HttpClient(const HttpClientConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

HttpClient::~HttpClient() = default;

HttpClient::HttpClient(HttpClient&&) noexcept = default;
HttpClient& HttpClient::operator=(HttpClient&&) noexcept = default;

HttpResponse HttpClient::execute(const HttpRequest& request) {
    return impl_->execute(request);
}

std::unique_ptr<HttpResponseStream> HttpClient::open_stream(const HttpRequest& request) {
    return impl_->open_stream(request);
}

// ============================================================================
// DigestAuthSigner
// ============================================================================

static std::string to_hex(const unsigned char* data, size_t len) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

static std::string digest_hex(const EVP_MD* md, const std::string& data) {

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        throw std::runtime_error("Failed to allocate digest context");
    }
    bool ok = EVP_DigestInit_ex(ctx, md, nullptr) == 1 &&
              EVP_DigestUpdate(ctx, data.data(), data.size()) == 1 &&
              EVP_DigestFinal_ex(ctx, hash, &hash_len) == 1;
    EVP_MD_CTX_free(ctx);
    if (!ok) {
        throw std::runtime_error("Digest computation failed");
    }

    return to_hex(hash, hash_len);
}

// Split `key=value, key="quoted, value"` into a map with lowercase keys
static std::map<std::string, std::string> parse_auth_params(const std::string& s) {
    std::map<std::string, std::string> params;
    size_t pos = 0;

    while (pos < s.size()) {
        while (pos < s.size() && (s[pos] == ' ' || s[pos] == ',' || s[pos] == '\t')) ++pos;
        size_t eq = s.find('=', pos);
        if (eq == std::string::npos) break;

        std::string key = s.substr(pos, eq - pos);
        while (!key.empty() && key.back() == ' ') key.pop_back();
        std::transform(key.begin(), key.end(), key.begin(),
                       [](unsigned char c) { return std::tolower(c); });

        pos = eq + 1;
        std::string value;
        if (pos < s.size() && s[pos] == '"') {
            ++pos;
            while (pos < s.size() && s[pos] != '"') {
                if (s[pos] == '\\' && pos + 1 < s.size()) ++pos;
                value += s[pos++];
            }
            ++pos;  // closing quote
        } else {
            size_t end = s.find(',', pos);
            if (end == std::string::npos) end = s.size();
            value = s.substr(pos, end - pos);
            while (!value.empty() && value.back() == ' ') value.pop_back();
            pos = end;
        }
        params[key] = value;
    }

    return params;
}

DigestAuthSigner::DigestAuthSigner(const std::string& username, const std::string& password)
    : username_(username)
    , password_(password) {}

bool DigestAuthSigner::update_challenge(const std::string& www_authenticate) {
    size_t start = www_authenticate.find_first_not_of(" \t");
    if (start == std::string::npos) return false;

    std::string scheme = www_authenticate.substr(start, 6);
    std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (scheme != "digest") return false;

    auto params = parse_auth_params(www_authenticate.substr(start + 6));
    if (params.count("nonce") == 0) return false;

    // Algorithm tokens are case-insensitive
    std::string algorithm = params.count("algorithm") ? params["algorithm"] : "MD5";
    std::string upper = algorithm;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    bool session = upper.ends_with("-SESS");
    if (session) upper.resize(upper.size() - 5);
    if (upper != "MD5" && upper != "SHA-256") {
        log_debug("Ignoring digest challenge with unsupported algorithm %s", algorithm.c_str());
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    realm_ = params["realm"];
    nonce_ = params["nonce"];
    opaque_ = params["opaque"];
    algorithm_ = algorithm;
    sha256_ = upper == "SHA-256";
    session_ = session;

    // Only qop=auth is supported; auth-int would require hashing the body
    qop_.clear();
    if (params.count("qop")) {
        std::istringstream qops(params["qop"]);
        std::string item;
        while (std::getline(qops, item, ',')) {
            item.erase(0, item.find_first_not_of(" \t"));
            while (!item.empty() && item.back() == ' ') item.pop_back();
            if (item == "auth") qop_ = "auth";
        }
    }

    nonce_count_ = 0;
    has_challenge_ = true;
    return true;
}

bool DigestAuthSigner::has_challenge() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return has_challenge_;
}

std::string DigestAuthSigner::authorization(const std::string& method,
                                            const std::string& uri,
                                            const std::string& cnonce) {
    std::lock_guard<std::mutex> lock(mutex_);

    ++nonce_count_;
    std::ostringstream nc_stream;
    nc_stream << std::hex << std::setw(8) << std::setfill('0') << nonce_count_;
    std::string nc = nc_stream.str();

    const EVP_MD* md = sha256_ ? EVP_sha256() : EVP_md5();
    std::string ha1 = digest_hex(md, username_ + ":" + realm_ + ":" + password_);
    if (session_) {
        ha1 = digest_hex(md, ha1 + ":" + nonce_ + ":" + cnonce);
    }
    std::string ha2 = digest_hex(md, method + ":" + uri);

    std::string response;
    if (!qop_.empty()) {
        response = digest_hex(md, ha1 + ":" + nonce_ + ":" + nc + ":" + cnonce + ":" +
                                  qop_ + ":" + ha2);
    } else {
        response = digest_hex(md, ha1 + ":" + nonce_ + ":" + ha2);
    }

    std::ostringstream header;
    header << "Digest username=\"" << username_ << "\""
           << ", realm=\"" << realm_ << "\""
           << ", nonce=\"" << nonce_ << "\""
           << ", uri=\"" << uri << "\""
           << ", algorithm=" << algorithm_
           << ", response=\"" << response << "\"";
    if (!qop_.empty()) {
        header << ", qop=" << qop_ << ", nc=" << nc << ", cnonce=\"" << cnonce << "\"";
    }
    if (!opaque_.empty()) {
        header << ", opaque=\"" << opaque_ << "\"";
    }
    return header.str();
}

void DigestAuthSigner::sign(HttpRequest& request) {
    unsigned char random[16];
    if (RAND_bytes(random, sizeof(random)) != 1) {
        throw std::runtime_error("Failed to generate client nonce");
    }
    std::string cnonce = to_hex(random, sizeof(random));

    auto url = ParsedUrl::parse(request.url);
    std::string uri = (url && !url->path.empty()) ? url->path : "/";
    if (url && !url->query.empty()) {
        uri += "?" + url->query;
    }

    request.headers.set("Authorization",
                        authorization(http_method_to_string(request.method), uri, cnonce));
}

} // namespace davdrive::net
