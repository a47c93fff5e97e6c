#pragma once

#include <string>
#include <filesystem>

namespace fs = std::filesystem;

// Hex digest of a file. algorithm is one of md5, sha1, sha256, sha512.
// Throws ZfetchException for an unknown algorithm or unreadable file.
std::string calculate_digest(const fs::path& file_path, const std::string& algorithm);

// checksum has the form "<algorithm>:<hex>", as published by the catalog.
// Returns false on a digest mismatch.
bool verify_checksum(const fs::path& file_path, const std::string& checksum);
