#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace davdrive {

// Pull-based source of bytes.
// read() fills at most buffer.size() bytes and returns the count; 0 means
// end of stream. Failures are reported by throwing.
class ByteStream {
public:
    virtual ~ByteStream() = default;

    virtual size_t read(std::span<uint8_t> buffer) = 0;
};

// Stream over an owned in-memory buffer
class MemoryStream : public ByteStream {
public:
    MemoryStream() = default;
    explicit MemoryStream(std::vector<uint8_t> data) : data_(std::move(data)) {}
    explicit MemoryStream(const std::string& data) : data_(data.begin(), data.end()) {}

    size_t read(std::span<uint8_t> buffer) override;

private:
    std::vector<uint8_t> data_;
    size_t pos_ = 0;
};

// Stream over a local file, optionally limited to the window
// [offset, offset + length).
class FileStream : public ByteStream {
public:
    explicit FileStream(const std::filesystem::path& path,
                        uint64_t offset = 0,
                        std::optional<uint64_t> length = std::nullopt);

    size_t read(std::span<uint8_t> buffer) override;

private:
    std::ifstream file_;
    std::optional<uint64_t> remaining_;
};

// Drain a stream, concatenating fragments in arrival order.
std::vector<uint8_t> read_all(ByteStream& stream);

// Copy a stream into an output stream. Returns the number of bytes copied.
uint64_t copy_stream(ByteStream& source, std::ostream& sink);

} // namespace davdrive
