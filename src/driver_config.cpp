#include "davdrive/driver/driver_config.hpp"
#include "davdrive/net/http.hpp"

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace davdrive {

namespace {

// Parse a positive integer option value, reporting bad input on stderr
std::optional<uint32_t> parse_seconds(const char* name, const char* value) {
    try {
        size_t consumed = 0;
        unsigned long v = std::stoul(value, &consumed);
        if (consumed == std::string(value).size() && v > 0 && v <= UINT32_MAX) {
            return static_cast<uint32_t>(v);
        }
    } catch (const std::exception&) {
        // Fall through to the error below
    }
    std::cerr << "Error: " << name << " expects a positive number of seconds, got: " << value << "\n";
    return std::nullopt;
}

void print_usage() {
    std::cerr <<
        "Usage: davdrive --base-url <url> [options] <command> [args]\n"
        "\n"
        "Commands:\n"
        "  ls [prefix]                      List files below prefix\n"
        "  stat <path>                      Show size and modification time\n"
        "  exists <path>                    Exit 0 if the file exists, 2 otherwise\n"
        "  get <path> [start [end]]         Write the file (or a byte range) to stdout\n"
        "  put <path> <file|->              Upload a local file (or stdin)\n"
        "  mv <src> <dest>                  Move a file\n"
        "  cp <src> <dest>                  Copy a file\n"
        "  rm <path>                        Delete a file\n"
        "  upload <path> <file> [chunk]     Chunked upload (default chunk: 8 MB)\n"
        "  extensions                       Print advertised upload extensions\n"
        "\n"
        "Remote store:\n"
        "  --base-url <url>                 WebDAV URL (http/https) or file:// directory\n"
        "  --username <name>                Username (or DAVDRIVE_USERNAME env)\n"
        "  --password <secret>              Password (or DAVDRIVE_PASSWORD env)\n"
        "  --root <path>                    Directory every path is scoped to (default: /)\n"
        "  --auth <type>                    auto, basic, digest, none (default: auto)\n"
        "  --no-verify-ssl                  Skip SSL verification\n"
        "  --ca-cert <path>                 CA certificate for SSL\n"
        "  --connect-timeout <secs>         Connect timeout (default: 10)\n"
        "  --request-timeout <secs>         Request timeout (default: 60)\n"
        "\n"
        "Options:\n"
        "  --config <path>                  JSON config file\n"
        "  --serialize-chunks               Serialize chunk writes per path in this process\n"
        "  --verbose                        Verbose output\n"
        "  --metrics-file <path>            Prometheus .prom file for node_exporter textfile collector\n"
        "  --help                           Show this help\n";
}

}  // namespace

std::optional<DriverConfig> DriverConfig::from_args(int argc, char* argv[],
                                                    std::vector<std::string>* positional) {
    DriverConfig config;

    auto next_arg = [&](int& i, const char* name) -> const char* {
        if (i + 1 >= argc) {
            std::cerr << "Error: " << name << " requires an argument\n";
            return nullptr;
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--base-url") {
            auto* v = next_arg(i, "--base-url");
            if (!v) return std::nullopt;
            config.base_url = v;
        } else if (arg == "--username") {
            auto* v = next_arg(i, "--username");
            if (!v) return std::nullopt;
            config.username = v;
        } else if (arg == "--password") {
            auto* v = next_arg(i, "--password");
            if (!v) return std::nullopt;
            config.password = v;
        } else if (arg == "--root") {
            auto* v = next_arg(i, "--root");
            if (!v) return std::nullopt;
            config.root = v;
        } else if (arg == "--auth") {
            auto* v = next_arg(i, "--auth");
            if (!v) return std::nullopt;
            config.auth_type = v;
        } else if (arg == "--no-verify-ssl") {
            config.verify_ssl = false;
        } else if (arg == "--ca-cert") {
            auto* v = next_arg(i, "--ca-cert");
            if (!v) return std::nullopt;
            config.ca_cert_path = v;
        } else if (arg == "--connect-timeout") {
            auto* v = next_arg(i, "--connect-timeout");
            if (!v) return std::nullopt;
            auto secs = parse_seconds("--connect-timeout", v);
            if (!secs) return std::nullopt;
            config.connect_timeout_secs = *secs;
        } else if (arg == "--request-timeout") {
            auto* v = next_arg(i, "--request-timeout");
            if (!v) return std::nullopt;
            auto secs = parse_seconds("--request-timeout", v);
            if (!secs) return std::nullopt;
            config.request_timeout_secs = *secs;
        } else if (arg == "--config") {
            auto* v = next_arg(i, "--config");
            if (!v) return std::nullopt;
            if (!config.load_json(v)) return std::nullopt;
        } else if (arg == "--serialize-chunks") {
            config.serialize_chunk_writes = true;
        } else if (arg == "--verbose") {
            config.verbose = true;
        } else if (arg == "--metrics-file") {
            auto* v = next_arg(i, "--metrics-file");
            if (!v) return std::nullopt;
            config.metrics_file = v;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return std::nullopt;
        } else if (arg.size() > 1 && arg[0] == '-') {
            std::cerr << "Error: unknown option: " << arg << "\n";
            return std::nullopt;
        } else if (positional) {
            positional->push_back(arg);
        } else {
            std::cerr << "Error: unexpected argument: " << arg << "\n";
            return std::nullopt;
        }
    }

    // Load credentials from environment if not set on CLI
    if (config.username.empty()) {
        if (const char* v = std::getenv("DAVDRIVE_USERNAME")) {
            config.username = v;
        }
    }
    if (config.password.empty()) {
        if (const char* v = std::getenv("DAVDRIVE_PASSWORD")) {
            config.password = v;
        }
    }

    config.apply_defaults();
    return config;
}

bool DriverConfig::load_json(const std::filesystem::path& path) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            std::cerr << "Error: cannot open config file: " << path << "\n";
            return false;
        }
        auto j = nlohmann::json::parse(ifs);

        if (j.contains("base_url")) base_url = j["base_url"].get<std::string>();
        if (j.contains("username")) username = j["username"].get<std::string>();
        if (j.contains("password")) password = j["password"].get<std::string>();
        if (j.contains("root")) root = j["root"].get<std::string>();
        if (j.contains("auth_type")) auth_type = j["auth_type"].get<std::string>();
        if (j.contains("verify_ssl")) verify_ssl = j["verify_ssl"].get<bool>();
        if (j.contains("ca_cert_path")) ca_cert_path = j["ca_cert_path"].get<std::string>();
        if (j.contains("connect_timeout")) connect_timeout_secs = j["connect_timeout"].get<uint32_t>();
        if (j.contains("request_timeout")) request_timeout_secs = j["request_timeout"].get<uint32_t>();
        if (j.contains("serialize_chunk_writes"))
            serialize_chunk_writes = j["serialize_chunk_writes"].get<bool>();
        if (j.contains("verbose")) verbose = j["verbose"].get<bool>();
        if (j.contains("metrics_file")) metrics_file = j["metrics_file"].get<std::string>();
        if (j.contains("metrics_interval")) metrics_interval_secs = j["metrics_interval"].get<size_t>();

        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing config: " << e.what() << "\n";
        return false;
    }
}

void DriverConfig::apply_defaults() {
    if (root.empty()) {
        root = constants::DEFAULT_ROOT;
    }
}

std::string DriverConfig::validate() const {
    if (base_url.empty()) return "base_url is required (--base-url)";
    auto url = net::ParsedUrl::parse(base_url);
    if (!url) return "base_url is not a valid URL: " + base_url;
    if (url->scheme != "http" && url->scheme != "https" && url->scheme != "file")
        return "base_url scheme must be http, https or file: " + base_url;
    if (url->scheme == "file" && url->path.empty()) return "file:// base_url requires a path";
    if (!parse_auth_type(auth_type)) return "unknown auth type: " + auth_type;
    if (connect_timeout_secs == 0) return "connect_timeout must be > 0";
    if (request_timeout_secs == 0) return "request_timeout must be > 0";
    if (metrics_interval_secs == 0) return "metrics_interval must be > 0";
    return {};
}

RemoteStoreOptions DriverConfig::store_options() const {
    RemoteStoreOptions options;
    options.base_url = base_url;
    options.username = username;
    options.password = password;
    options.auth = parse_auth_type(auth_type).value_or(AuthType::Auto);
    options.verify_ssl = verify_ssl;
    options.ca_cert_path = ca_cert_path;
    options.connect_timeout_secs = connect_timeout_secs;
    options.request_timeout_secs = request_timeout_secs;
    options.verbose = verbose;
    return options;
}

}  // namespace davdrive
