// davdrive: command line front end for the WebDAV storage driver.
//
// Usage: davdrive --base-url <url> [options] <command> [args]
//
// Commands:
//   ls [prefix]                  List files below prefix
//   stat <path>                  Size and modification time
//   exists <path>                Exit 0 if the file exists
//   get <path> [start [end]]     Stream a file or byte range to stdout
//   put <path> <file|->          Replace a remote file
//   mv / cp <src> <dest>         Move or copy
//   rm <path>                    Delete
//   upload <path> <file> [N]     Chunked upload in N-byte chunks
//   extensions                   Advertised upload extensions

#include "davdrive/core/constants.hpp"
#include "davdrive/core/error.hpp"
#include "davdrive/core/log.hpp"
#include "davdrive/driver/driver.hpp"
#include "davdrive/net/http.hpp"

#include <chrono>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

constexpr int EXIT_USAGE = 1;
constexpr int EXIT_BACKEND = 2;

// Standard input as a byte stream
class StdinStream : public davdrive::ByteStream {
public:
    size_t read(std::span<uint8_t> buffer) override {
        size_t n = fread(buffer.data(), 1, buffer.size(), stdin);
        if (n == 0 && ferror(stdin)) {
            throw std::runtime_error("Failed to read standard input");
        }
        return n;
    }
};

std::optional<uint64_t> parse_u64(const std::string& s) {
    try {
        size_t consumed = 0;
        uint64_t v = std::stoull(s, &consumed);
        if (consumed == s.size()) return v;
    } catch (const std::exception&) {
        // Reported by the caller
    }
    return std::nullopt;
}

int usage_error(const std::string& message) {
    std::cerr << "Error: " << message << "\n"
              << "Run 'davdrive --help' for usage.\n";
    return EXIT_USAGE;
}

int cmd_ls(davdrive::WebDavTusDriver& driver, const std::vector<std::string>& args) {
    auto listing = driver.list(args.size() > 1 ? args[1] : "");
    for (const auto& path : listing) {
        std::cout << path << "\n";
    }
    return 0;
}

int cmd_stat(davdrive::WebDavTusDriver& driver, const std::vector<std::string>& args) {
    if (args.size() != 2) return usage_error("stat requires <path>");
    auto meta = driver.stat(args[1]);
    std::cout << "size: " << meta.size << "\n"
              << "modified: " << davdrive::net::format_http_date(meta.modified) << "\n";
    return 0;
}

int cmd_exists(davdrive::WebDavTusDriver& driver, const std::vector<std::string>& args) {
    if (args.size() != 2) return usage_error("exists requires <path>");
    bool found = driver.exists(args[1]);
    std::cout << (found ? "yes" : "no") << "\n";
    return found ? 0 : EXIT_BACKEND;
}

int cmd_get(davdrive::WebDavTusDriver& driver, const std::vector<std::string>& args) {
    if (args.size() < 2 || args.size() > 4) return usage_error("get requires <path> [start [end]]");

    davdrive::ReadOptions options;
    if (args.size() >= 3) {
        davdrive::ReadRange range;
        auto start = parse_u64(args[2]);
        if (!start) return usage_error("invalid range start: " + args[2]);
        range.start = *start;
        if (args.size() == 4) {
            auto end = parse_u64(args[3]);
            if (!end || *end < *start) return usage_error("invalid range end: " + args[3]);
            range.end = *end;
        }
        options.range = range;
    }

    auto stream = driver.read(args[1], options);
    davdrive::copy_stream(*stream, std::cout);
    std::cout.flush();
    return 0;
}

int cmd_put(davdrive::WebDavTusDriver& driver, const std::vector<std::string>& args) {
    if (args.size() != 3) return usage_error("put requires <path> <file|->");

    if (args[2] == "-") {
        StdinStream input;
        driver.write(args[1], input);
    } else {
        davdrive::FileStream input(args[2]);
        driver.write(args[1], input);
    }
    return 0;
}

int cmd_move_or_copy(davdrive::WebDavTusDriver& driver, const std::vector<std::string>& args,
                     bool is_move) {
    if (args.size() != 3) return usage_error(args[0] + " requires <src> <dest>");
    if (is_move) {
        driver.move(args[1], args[2]);
    } else {
        driver.copy(args[1], args[2]);
    }
    return 0;
}

int cmd_rm(davdrive::WebDavTusDriver& driver, const std::vector<std::string>& args) {
    if (args.size() != 2) return usage_error("rm requires <path>");
    driver.remove(args[1]);
    return 0;
}

int cmd_upload(davdrive::WebDavTusDriver& driver, const std::vector<std::string>& args) {
    if (args.size() < 3 || args.size() > 4) return usage_error("upload requires <path> <file> [chunk-bytes]");

    uint64_t chunk_size = davdrive::constants::DEFAULT_UPLOAD_CHUNK_SIZE;
    if (args.size() == 4) {
        auto parsed = parse_u64(args[3]);
        if (!parsed || *parsed == 0) return usage_error("invalid chunk size: " + args[3]);
        chunk_size = *parsed;
    }

    std::error_code ec;
    uint64_t total = std::filesystem::file_size(args[2], ec);
    if (ec) {
        return usage_error("cannot read " + args[2] + ": " + ec.message());
    }

    const std::string& remote = args[1];
    const std::string& local = args[2];
    davdrive::ChunkedUploadContext context;
    context.size = total;
    context.metadata["filename"] = std::filesystem::path(local).filename().string();

    uint64_t uploaded = davdrive::upload_in_chunks(
        driver, remote, context, total, chunk_size,
        [&local](uint64_t offset, uint64_t length) -> std::unique_ptr<davdrive::ByteStream> {
            return std::make_unique<davdrive::FileStream>(local, offset, length);
        });

    davdrive::log_info("Uploaded %s (%llu bytes)", remote.c_str(),
                       static_cast<unsigned long long>(uploaded));
    return 0;
}

int cmd_extensions(davdrive::WebDavTusDriver& driver) {
    for (const auto& ext : driver.tus_extensions()) {
        std::cout << ext << "\n";
    }
    return 0;
}

int dispatch(davdrive::WebDavTusDriver& driver, const std::vector<std::string>& args) {
    const std::string& command = args[0];

    if (command == "ls") return cmd_ls(driver, args);
    if (command == "stat") return cmd_stat(driver, args);
    if (command == "exists") return cmd_exists(driver, args);
    if (command == "get") return cmd_get(driver, args);
    if (command == "put") return cmd_put(driver, args);
    if (command == "mv") return cmd_move_or_copy(driver, args, true);
    if (command == "cp") return cmd_move_or_copy(driver, args, false);
    if (command == "rm") return cmd_rm(driver, args);
    if (command == "upload") return cmd_upload(driver, args);
    if (command == "extensions") return cmd_extensions(driver);

    return usage_error("unknown command: " + command);
}

}  // namespace

int main(int argc, char* argv[]) {
    std::vector<std::string> args;
    auto config_opt = davdrive::DriverConfig::from_args(argc, argv, &args);
    if (!config_opt) {
        return EXIT_USAGE;
    }
    auto config = std::move(*config_opt);

    auto err = config.validate();
    if (!err.empty()) {
        std::cerr << "Configuration error: " << err << "\n";
        return EXIT_USAGE;
    }
    if (args.empty()) {
        return usage_error("no command given");
    }

    davdrive::set_verbose_logging(config.verbose);
    davdrive::log_debug("base-url: %s", config.base_url.c_str());
    davdrive::log_debug("root: %s", config.root.c_str());
    davdrive::log_debug("auth: %s", config.auth_type.c_str());
    davdrive::log_debug("username: %s", config.username.empty() ? "(none)" : config.username.c_str());
    davdrive::log_debug("password: %s", config.password.empty() ? "(none)" : "****");

    std::unique_ptr<davdrive::MetricsExporter> metrics;
    if (!config.metrics_file.empty()) {
        metrics = std::make_unique<davdrive::MetricsExporter>(
            config.metrics_file, std::chrono::seconds(config.metrics_interval_secs),
            std::map<std::string, std::string>{{"command", args[0]}});
        metrics->start();
    }

    int rc = 0;
    try {
        davdrive::WebDavTusDriver driver(config, metrics.get());
        rc = dispatch(driver, args);
    } catch (const davdrive::RemoteError& e) {
        davdrive::log_error("%s", e.what());
        rc = EXIT_BACKEND;
    } catch (const std::exception& e) {
        davdrive::log_error("%s", e.what());
        rc = EXIT_BACKEND;
    }

    if (metrics) {
        metrics->stop();
    }
    return rc;
}
