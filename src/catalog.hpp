#pragma once

#include "http_client.hpp"
#include "manifest.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

struct CatalogRecord {
    std::string id;
    std::string title;
    Manifest entries;
};

// Accepts "1234567", "https://zenodo.org/record/1234567" or
// "https://zenodo.org/records/1234567".
std::optional<std::string> parse_record_id(std::string_view input);

std::string record_api_url(const std::string& record_id);

// Normalizes the "files" array of a record document into manifest entries.
// Entries lacking a name or uri are kept with the field empty; the batch run
// skips them. Throws ZfetchException on malformed JSON.
CatalogRecord parse_record(const std::string& json_text);

CatalogRecord fetch_record(HttpClient& http, const std::string& record_id);

// Same document shape as parse_record, read from disk.
CatalogRecord load_manifest_file(const std::filesystem::path& path);

// "Zenodo_<id>_<title>" with the title reduced to letters, digits, space, '-' and '_'.
std::string output_dir_name(const std::string& record_id, const std::string& title);
