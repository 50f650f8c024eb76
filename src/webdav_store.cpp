#include "davdrive/storage/webdav.hpp"
#include "davdrive/core/constants.hpp"
#include "davdrive/core/error.hpp"
#include "davdrive/core/log.hpp"
#include "davdrive/net/http.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>

namespace davdrive {

// ============================================================================
// XML parsing helpers for multistatus responses
// ============================================================================

namespace xml {

namespace {

// Local part of a qualified name ("d:href" -> "href")
std::string local_part(const std::string& qname) {
    auto colon = qname.find(':');
    return colon == std::string::npos ? qname : qname.substr(colon + 1);
}

} // namespace

std::vector<ElementRange> find_elements(const std::string& xml, const std::string& local_name) {
    std::vector<ElementRange> results;

    size_t pos = 0;
    while (pos < xml.size()) {
        size_t start = xml.find('<', pos);
        if (start == std::string::npos) break;

        // Skip closing tags, comments, processing instructions
        if (start + 1 >= xml.size() || xml[start + 1] == '/' ||
            xml[start + 1] == '?' || xml[start + 1] == '!') {
            pos = start + 1;
            continue;
        }

        size_t name_end = xml.find_first_of(" \t\r\n/>", start + 1);
        size_t tag_end = xml.find('>', start);
        if (name_end == std::string::npos || tag_end == std::string::npos) break;

        std::string qname = xml.substr(start + 1, name_end - start - 1);
        if (local_part(qname) != local_name) {
            pos = tag_end + 1;
            continue;
        }

        ElementRange range;
        if (xml[tag_end - 1] == '/') {
            // Self-closing: <d:collection/>
            range.content_start = tag_end + 1;
            range.content_end = tag_end + 1;
            range.element_end = tag_end + 1;
        } else {
            std::string close_tag = "</" + qname + ">";
            size_t end = xml.find(close_tag, tag_end + 1);
            if (end == std::string::npos) break;

            range.content_start = tag_end + 1;
            range.content_end = end;
            range.element_end = end + close_tag.length();
        }
        results.push_back(range);

        pos = range.element_end;
    }

    return results;
}

std::string get_element(const std::string& xml, const std::string& local_name) {
    auto ranges = find_elements(xml, local_name);
    if (ranges.empty()) return "";
    const auto& r = ranges.front();
    return xml.substr(r.content_start, r.content_end - r.content_start);
}

bool has_element(const std::string& xml, const std::string& local_name) {
    return !find_elements(xml, local_name).empty();
}

// Decode XML entities (predefined set plus numeric references)
std::string decode_entities(const std::string& s) {
    std::string result;
    result.reserve(s.size());

    size_t i = 0;
    while (i < s.size()) {
        if (s[i] == '&') {
            if (s.compare(i, 4, "&lt;") == 0) {
                result += '<';
                i += 4;
            } else if (s.compare(i, 4, "&gt;") == 0) {
                result += '>';
                i += 4;
            } else if (s.compare(i, 5, "&amp;") == 0) {
                result += '&';
                i += 5;
            } else if (s.compare(i, 6, "&quot;") == 0) {
                result += '"';
                i += 6;
            } else if (s.compare(i, 6, "&apos;") == 0) {
                result += '\'';
                i += 6;
            } else if (s.compare(i, 2, "&#") == 0 && s.find(';', i) != std::string::npos) {
                size_t semi = s.find(';', i);
                std::string num = s.substr(i + 2, semi - i - 2);
                try {
                    unsigned long code = (!num.empty() && (num[0] == 'x' || num[0] == 'X'))
                        ? std::stoul(num.substr(1), nullptr, 16)
                        : std::stoul(num);
                    if (code > 0 && code < 0x80) {
                        result += static_cast<char>(code);
                        i = semi + 1;
                        continue;
                    }
                } catch (const std::exception&) {
                    // Malformed reference, keep as-is
                }
                result += s[i++];
            } else {
                // Unknown entity, keep as-is
                result += s[i++];
            }
        } else {
            result += s[i++];
        }
    }

    return result;
}

} // namespace xml

// ============================================================================
// Multistatus parsing
// ============================================================================

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string strip_trailing_slash(std::string path) {
    while (path.size() > 1 && path.back() == '/') {
        path.pop_back();
    }
    return path;
}

} // namespace

std::string propfind_body() {
    return "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n"
           "<d:propfind xmlns:d=\"DAV:\">\n"
           "  <d:prop>\n"
           "    <d:getcontentlength/>\n"
           "    <d:getlastmodified/>\n"
           "    <d:getetag/>\n"
           "    <d:getcontenttype/>\n"
           "    <d:resourcetype/>\n"
           "  </d:prop>\n"
           "</d:propfind>";
}

std::vector<RemoteStat> parse_multistatus(const std::string& body, const std::string& base_path) {
    std::vector<RemoteStat> entries;
    std::string prefix = strip_trailing_slash(base_path);
    if (prefix == "/") prefix.clear();

    for (const auto& range : xml::find_elements(body, "response")) {
        std::string response = body.substr(range.content_start,
                                           range.content_end - range.content_start);

        std::string href = trim(xml::decode_entities(xml::get_element(response, "href")));
        if (href.empty()) continue;

        // Servers may answer with absolute URLs
        if (href.find("://") != std::string::npos) {
            auto url = net::ParsedUrl::parse(href);
            href = url ? url->path : "/";
        }

        std::string path = net::url_decode(href);
        if (!prefix.empty() && path.starts_with(prefix) &&
            (path.size() == prefix.size() || path[prefix.size()] == '/')) {
            path = path.substr(prefix.size());
        }
        if (path.empty() || path.front() != '/') {
            path = "/" + path;
        }

        RemoteStat entry;
        entry.filename = strip_trailing_slash(path);
        auto slash = entry.filename.rfind('/');
        entry.basename = entry.filename.substr(slash + 1);

        // Only properties reported with 200 OK count
        for (const auto& ps : xml::find_elements(response, "propstat")) {
            std::string propstat = response.substr(ps.content_start,
                                                   ps.content_end - ps.content_start);
            std::string status = xml::get_element(propstat, "status");
            if (!status.empty() && status.find(" 200") == std::string::npos) {
                continue;
            }

            std::string prop = xml::get_element(propstat, "prop");

            if (xml::has_element(xml::get_element(prop, "resourcetype"), "collection")) {
                entry.type = EntryType::Directory;
            }

            std::string length = trim(xml::get_element(prop, "getcontentlength"));
            if (!length.empty()) {
                try {
                    entry.size = std::stoull(length);
                } catch (const std::exception&) {
                    log_debug("Ignoring invalid content length '%s' for %s",
                              length.c_str(), entry.filename.c_str());
                }
            }

            std::string lastmod = trim(xml::decode_entities(xml::get_element(prop, "getlastmodified")));
            if (!lastmod.empty()) {
                entry.lastmod = lastmod;
            }

            std::string etag = trim(xml::decode_entities(xml::get_element(prop, "getetag")));
            if (etag.starts_with("W/")) etag = etag.substr(2);
            if (etag.size() >= 2 && etag.front() == '"' && etag.back() == '"') {
                etag = etag.substr(1, etag.size() - 2);
            }
            if (!etag.empty()) entry.etag = etag;

            std::string mime = trim(xml::get_element(prop, "getcontenttype"));
            if (!mime.empty()) entry.mime = mime;
        }

        entries.push_back(std::move(entry));
    }

    return entries;
}

// ============================================================================
// WebDavRemoteStore - WebDAV over the libcurl client
// ============================================================================

namespace {

class WebDavRemoteStore : public RemoteStore {
public:
    explicit WebDavRemoteStore(const RemoteStoreOptions& options)
        : options_(options)
        , digest_(options.username, options.password) {
        auto url = net::ParsedUrl::parse(options_.base_url);
        if (!url) {
            throw std::invalid_argument("Invalid WebDAV base URL: " + options_.base_url);
        }

        base_url_ = options_.base_url;
        while (!base_url_.empty() && base_url_.back() == '/') {
            base_url_.pop_back();
        }
        base_path_ = strip_trailing_slash(net::url_decode(url->path));

        net::HttpClientConfig http_config;
        http_config.user_agent = constants::DEFAULT_USER_AGENT;
        http_config.verify_ssl_by_default = options_.verify_ssl;
        http_config.default_ca_bundle = options_.ca_cert_path;
        http_config.default_connect_timeout = std::chrono::seconds(options_.connect_timeout_secs);
        http_config.default_total_timeout = std::chrono::seconds(options_.request_timeout_secs);
        http_config.max_response_size = constants::DEFAULT_MAX_RESPONSE_SIZE;
        http_config.verbose = options_.verbose;
        http_client_ = std::make_unique<net::HttpClient>(http_config);

        log_debug("WebDAV store at %s (auth: %s)", base_url_.c_str(),
                  auth_type_to_string(options_.auth));
    }

    std::string type_name() const override { return "webdav"; }

    Response<RemoteStat> stat(const std::string& path) const override {
        auto request = propfind_request(path, "0");
        auto response = send(request);
        check(response, "PROPFIND", path);

        auto entries = parse_multistatus(response.body_string(), base_path_);
        if (entries.empty()) {
            throw RemoteError("Invalid PROPFIND response for " + path, response.status_code);
        }
        return envelope(std::move(entries.front()), response);
    }

    std::unique_ptr<ByteStream> create_read_stream(
        const std::string& path,
        const std::map<std::string, std::string>& headers) const override {
        net::HttpRequest request = make_request(net::HttpMethod::GET, path);
        for (const auto& [name, value] : headers) {
            request.headers.set(name, value);
        }

        authorize(request);
        auto stream = http_client_->open_stream(request);
        if (stream->status_code() == 401 && learn_challenge(stream->headers())) {
            authorize(request);
            stream = http_client_->open_stream(request);
        }

        if (!stream->error().empty()) {
            throw RemoteError("GET " + path + ": " + stream->error(), 0, true);
        }
        if (!net::is_success_status(stream->status_code())) {
            throw RemoteError("GET " + path + " failed: HTTP " +
                              std::to_string(stream->status_code()), stream->status_code());
        }
        return stream;
    }

    Response<FileContents> get_file_contents(const std::string& path,
                                             ContentFormat format) const override {
        net::HttpRequest request = make_request(net::HttpMethod::GET, path);
        auto response = send(request);
        check(response, "GET", path);

        if (format == ContentFormat::Text) {
            return envelope(FileContents{response.body_string()}, response);
        }
        std::vector<uint8_t> body = std::move(response.body);
        return envelope(FileContents{std::move(body)}, response);
    }

    void put_file_contents(const std::string& path, std::span<const uint8_t> data) override {
        net::HttpRequest request = make_request(net::HttpMethod::PUT, path);
        request.body.assign(data.begin(), data.end());
        request.headers.set_content_type("application/octet-stream");

        auto response = send(request);
        check(response, "PUT", path);
    }

    void put_file_stream(const std::string& path, ByteStream& stream) override {
        // The body cannot be replayed, so any digest challenge must be known up front
        ensure_challenge();

        net::HttpRequest request = make_request(net::HttpMethod::PUT, path);
        request.headers.set_content_type("application/octet-stream");
        request.body_reader = [&stream](uint8_t* buffer, size_t size) {
            return stream.read(std::span<uint8_t>(buffer, size));
        };

        auto response = send(request);
        check(response, "PUT", path);
    }

    void move_file(const std::string& source, const std::string& destination) override {
        net::HttpRequest request = make_request(net::HttpMethod::MOVE, source);
        request.headers.set("Destination", build_url(destination));
        request.headers.set("Overwrite", "T");

        auto response = send(request);
        check(response, "MOVE", source);
    }

    void copy_file(const std::string& source, const std::string& destination) override {
        net::HttpRequest request = make_request(net::HttpMethod::COPY, source);
        request.headers.set("Destination", build_url(destination));
        request.headers.set("Overwrite", "T");

        auto response = send(request);
        check(response, "COPY", source);
    }

    void delete_file(const std::string& path) override {
        net::HttpRequest request = make_request(net::HttpMethod::DELETE, path);
        auto response = send(request);
        check(response, "DELETE", path);
    }

    Response<std::vector<DirectoryEntry>> get_directory_contents(
        const std::string& path, bool deep) const override {
        auto request = propfind_request(path, deep ? "infinity" : "1");
        auto response = send(request);
        check(response, "PROPFIND", path);

        std::string self = strip_trailing_slash(path.empty() ? "/" : path);
        if (self.front() != '/') self = "/" + self;

        std::vector<DirectoryEntry> entries;
        for (auto& entry : parse_multistatus(response.body_string(), base_path_)) {
            if (entry.filename == self) continue;
            entries.push_back(std::move(entry));
        }
        return envelope(std::move(entries), response);
    }

private:
    RemoteStoreOptions options_;
    std::string base_url_;   // Without trailing slash
    std::string base_path_;  // Decoded path component of base_url_
    std::unique_ptr<net::HttpClient> http_client_;

    mutable net::DigestAuthSigner digest_;
    mutable std::atomic<bool> digest_active_{false};
    mutable std::atomic<bool> challenge_probed_{false};

    std::string build_url(const std::string& path) const {
        std::string p = path;
        if (p.empty() || p.front() != '/') {
            p = "/" + p;
        }
        return base_url_ + net::url_encode_path(p);
    }

    net::HttpRequest make_request(net::HttpMethod method, const std::string& path) const {
        // Timeouts come from the client defaults, where the environment can override them
        net::HttpRequest request = net::HttpRequest::make(method, build_url(path));
        request.verify_ssl = options_.verify_ssl;
        request.ca_bundle_path = options_.ca_cert_path;
        return request;
    }

    net::HttpRequest propfind_request(const std::string& path, const std::string& depth) const {
        net::HttpRequest request = make_request(net::HttpMethod::PROPFIND, path);
        request.headers.set("Depth", depth);
        request.set_xml_body(propfind_body());
        return request;
    }

    // Attach credentials for the configured auth mode
    void authorize(net::HttpRequest& request) const {
        switch (options_.auth) {
            case AuthType::None:
                break;
            case AuthType::Basic:
                request.headers.set_basic_auth(options_.username, options_.password);
                break;
            case AuthType::Digest:
                if (digest_.has_challenge()) {
                    digest_.sign(request);
                }
                break;
            case AuthType::Auto:
                if (digest_active_.load() && digest_.has_challenge()) {
                    digest_.sign(request);
                } else {
                    request.headers.set_basic_auth(options_.username, options_.password);
                }
                break;
        }
    }

    // Record a Digest challenge from a 401 response. Returns true if the
    // request should be re-sent with the new credentials.
    bool learn_challenge(const net::HttpHeaders& headers) const {
        if (options_.auth != AuthType::Digest && options_.auth != AuthType::Auto) {
            return false;
        }
        for (const auto& value : headers.get_all("WWW-Authenticate")) {
            if (digest_.update_challenge(value)) {
                digest_active_.store(true);
                log_debug("Switching to digest authentication for %s", base_url_.c_str());
                return true;
            }
        }
        return false;
    }

    // Learn the digest challenge before sending a body that cannot be replayed
    void ensure_challenge() const {
        if (options_.auth != AuthType::Digest && options_.auth != AuthType::Auto) return;
        if (digest_.has_challenge() || challenge_probed_.exchange(true)) return;

        auto probe = propfind_request("/", "0");
        auto response = send(probe);
        if (!response.error.empty()) {
            log_debug("Authentication probe failed: %s", response.error.c_str());
        }
    }

    net::HttpResponse send(net::HttpRequest& request) const {
        authorize(request);
        auto response = http_client_->execute(request);

        if (response.status_code == 401 && request.replayable() &&
            learn_challenge(response.headers)) {
            authorize(request);
            response = http_client_->execute(request);
        } else if (response.status_code == 401) {
            // Keep the challenge for the next request even if this one cannot be replayed
            learn_challenge(response.headers);
        }
        return response;
    }

    static void check(const net::HttpResponse& response, const std::string& method,
                      const std::string& path) {
        if (response.is_network_error) {
            throw RemoteError(method + " " + path + ": " + response.error, 0, true);
        }
        if (!response.ok()) {
            std::string message = method + " " + path + " failed: HTTP " +
                                  std::to_string(response.status_code);
            if (!response.error.empty()) {
                message += " (" + response.error + ")";
            }
            log_debug("%s", message.c_str());
            throw RemoteError(message, response.status_code);
        }
    }

    template <typename T>
    static Envelope<T> envelope(T data, const net::HttpResponse& response) {
        Envelope<T> env;
        env.data = std::move(data);
        env.status = response.status_code;
        for (const auto& [name, value] : response.headers.all()) {
            env.headers[name] = value;
        }
        return env;
    }
};

} // namespace

std::unique_ptr<RemoteStore> make_webdav_store(const RemoteStoreOptions& options) {
    return std::make_unique<WebDavRemoteStore>(options);
}

} // namespace davdrive
