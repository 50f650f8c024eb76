#pragma once

#include "davdrive/storage/backend.hpp"

#include <string>
#include <vector>

namespace davdrive {

// Namespace-agnostic helpers for WebDAV multistatus bodies.
// Elements are matched by local name, so <d:href>, <D:href> and <href> are equivalent.
namespace xml {

struct ElementRange {
    size_t content_start = 0;
    size_t content_end = 0;
    size_t element_end = 0;  // Position after closing tag
};

std::vector<ElementRange> find_elements(const std::string& xml, const std::string& local_name);

// Content of the first matching element, empty if not found
std::string get_element(const std::string& xml, const std::string& local_name);

bool has_element(const std::string& xml, const std::string& local_name);

std::string decode_entities(const std::string& s);

} // namespace xml

// Request body asking for the properties a RemoteStat carries
std::string propfind_body();

// Parse a 207 Multi-Status body into entries.
// `base_path` is the path component of the store's base URL; it is removed
// from every href so filenames come out as absolute remote paths.
std::vector<RemoteStat> parse_multistatus(const std::string& body, const std::string& base_path);

} // namespace davdrive
