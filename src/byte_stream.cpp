#include "davdrive/core/byte_stream.hpp"
#include "davdrive/core/constants.hpp"

#include <algorithm>
#include <cstring>
#include <ostream>
#include <stdexcept>

namespace davdrive {

// ============================================================================
// MemoryStream
// ============================================================================

size_t MemoryStream::read(std::span<uint8_t> buffer) {
    size_t to_copy = std::min(buffer.size(), data_.size() - pos_);
    if (to_copy > 0) {
        std::memcpy(buffer.data(), data_.data() + pos_, to_copy);
        pos_ += to_copy;
    }
    return to_copy;
}

// ============================================================================
// FileStream
// ============================================================================

FileStream::FileStream(const std::filesystem::path& path,
                       uint64_t offset,
                       std::optional<uint64_t> length)
    : file_(path, std::ios::binary)
    , remaining_(length) {
    if (!file_) {
        throw std::runtime_error("Failed to open file: " + path.string());
    }
    if (offset > 0) {
        file_.seekg(static_cast<std::streamoff>(offset));
        if (!file_) {
            throw std::runtime_error("Failed to seek in file: " + path.string());
        }
    }
}

size_t FileStream::read(std::span<uint8_t> buffer) {
    size_t want = buffer.size();
    if (remaining_) {
        want = static_cast<size_t>(std::min<uint64_t>(want, *remaining_));
    }
    if (want == 0 || file_.eof()) return 0;

    file_.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(want));
    auto got = static_cast<size_t>(file_.gcount());
    if (file_.bad()) {
        throw std::runtime_error("Failed to read file");
    }
    if (remaining_) {
        *remaining_ -= got;
    }
    return got;
}

// ============================================================================
// Helpers
// ============================================================================

std::vector<uint8_t> read_all(ByteStream& stream) {
    std::vector<uint8_t> result;
    std::vector<uint8_t> buffer(constants::DEFAULT_STREAM_BUFFER_SIZE);
    while (true) {
        size_t n = stream.read(buffer);
        if (n == 0) break;
        result.insert(result.end(), buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(n));
    }
    return result;
}

uint64_t copy_stream(ByteStream& source, std::ostream& sink) {
    uint64_t total = 0;
    std::vector<uint8_t> buffer(constants::DEFAULT_STREAM_BUFFER_SIZE);
    while (true) {
        size_t n = source.read(buffer);
        if (n == 0) break;
        sink.write(reinterpret_cast<const char*>(buffer.data()), static_cast<std::streamsize>(n));
        if (!sink) {
            throw std::runtime_error("Failed to write output stream");
        }
        total += n;
    }
    return total;
}

} // namespace davdrive
