#pragma once

#include <string>

namespace davdrive {

// Maps caller-relative paths into the configured root and back.
// Confinement is lexical only: ".." in caller input is not rejected.
class PathNormalizer {
public:
    explicit PathNormalizer(std::string root = "/");

    // root (one trailing '/' trimmed) + '/' + path (one leading '/' trimmed)
    std::string normalize(const std::string& path) const;

    // Path of `absolute` relative to the root, with leading '/' removed.
    // "." and ".." segments are resolved lexically; the root itself maps to "".
    std::string denormalize(const std::string& absolute) const;

    const std::string& root() const { return root_; }

private:
    std::string root_;
};

} // namespace davdrive
