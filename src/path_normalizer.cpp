#include "davdrive/storage/path_normalizer.hpp"

#include <filesystem>
#include <utility>

namespace davdrive {

namespace {

// Non-absolute inputs are taken as rooted at "/"
std::filesystem::path as_absolute(const std::string& p) {
    std::string s = (p.empty() || p.front() != '/') ? "/" + p : p;
    while (s.size() > 1 && s.back() == '/') {
        s.pop_back();
    }
    return std::filesystem::path(s).lexically_normal();
}

} // namespace

PathNormalizer::PathNormalizer(std::string root)
    : root_(std::move(root)) {}

std::string PathNormalizer::normalize(const std::string& path) const {
    std::string base = root_;
    if (!base.empty() && base.back() == '/') {
        base.pop_back();
    }

    std::string rel = path;
    if (!rel.empty() && rel.front() == '/') {
        rel.erase(0, 1);
    }

    return base + "/" + rel;
}

std::string PathNormalizer::denormalize(const std::string& absolute) const {
    auto relative = as_absolute(absolute).lexically_relative(as_absolute(root_));

    std::string result = relative.generic_string();
    if (result == ".") {
        result.clear();
    }

    while (!result.empty() && result.front() == '/') {
        result.erase(0, 1);
    }
    return result;
}

} // namespace davdrive
