#pragma once

#include "davdrive/core/byte_stream.hpp"
#include "davdrive/storage/backend.hpp"
#include "davdrive/storage/path_normalizer.hpp"

#include <chrono>
#include <cstdint>
#include <iterator>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace davdrive {

// File metadata as seen by the host
struct FileMetadata {
    uint64_t size = 0;
    std::chrono::system_clock::time_point modified;
};

// Inclusive byte range; an absent end reads to the end of the object
struct ReadRange {
    uint64_t start = 0;
    std::optional<uint64_t> end;
};

struct ReadOptions {
    std::optional<ReadRange> range;
};

// Format a Range header value: "bytes=start-end" or "bytes=start-"
std::string range_header(const ReadRange& range);

// Forward-only, one-shot sequence of root-relative file paths
class FileListing {
public:
    explicit FileListing(std::vector<std::string> paths);

    // Next path, or nullopt once exhausted
    std::optional<std::string> next();

    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = std::string;
        using difference_type = std::ptrdiff_t;
        using pointer = const std::string*;
        using reference = const std::string&;

        iterator() = default;
        explicit iterator(FileListing* listing);

        reference operator*() const { return *current_; }
        pointer operator->() const { return &*current_; }
        iterator& operator++();
        void operator++(int) { ++*this; }

        bool operator==(const iterator& other) const {
            return !current_ && !other.current_;
        }
        bool operator!=(const iterator& other) const { return !(*this == other); }

    private:
        FileListing* listing_ = nullptr;
        std::optional<std::string> current_;
    };

    iterator begin() { return iterator(this); }
    iterator end() { return iterator(); }

private:
    std::vector<std::string> paths_;
    size_t pos_ = 0;
};

// Uniform wrapper over a RemoteStore: scopes every path under the root and
// resolves the store's response shapes. Errors from the store propagate unchanged.
class RemoteStoreAdapter {
public:
    RemoteStoreAdapter(std::shared_ptr<RemoteStore> store, PathNormalizer paths);

    std::unique_ptr<ByteStream> read(const std::string& path,
                                     const ReadOptions& options = {}) const;

    // Missing size reads as 0, missing or unparseable lastmod as now
    FileMetadata stat(const std::string& path) const;

    // False on any stat failure
    bool exists(const std::string& path) const;

    void move(const std::string& source, const std::string& destination);
    void copy(const std::string& source, const std::string& destination);

    // Replace the whole object with the stream contents
    void write(const std::string& path, ByteStream& content);

    void remove(const std::string& path);

    // Root-relative paths of all files below `prefix` (one deep listing request)
    FileListing list(const std::string& prefix = "") const;

    // Whole object as bytes, whatever payload form the store answered with
    std::vector<uint8_t> read_contents(const std::string& path) const;
    void write_contents(const std::string& path, std::span<const uint8_t> data);

    const PathNormalizer& paths() const { return paths_; }
    RemoteStore& store() const { return *store_; }

private:
    std::shared_ptr<RemoteStore> store_;
    PathNormalizer paths_;
};

} // namespace davdrive
