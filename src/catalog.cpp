#include "catalog.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <regex>
#include <sstream>

using json = nlohmann::json;

namespace {

// First string value found under any of the keys.
std::string first_string(const json& obj, std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        auto it = obj.find(key);
        if (it != obj.end() && it->is_string() && !it->get_ref<const std::string&>().empty()) {
            return it->get<std::string>();
        }
    }
    return {};
}

std::optional<std::uint64_t> first_size(const json& obj, std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        auto it = obj.find(key);
        if (it != obj.end() && it->is_number_integer() && it->get<long long>() >= 0) {
            return it->get<std::uint64_t>();
        }
    }
    return std::nullopt;
}

ManifestEntry parse_file(const json& file) {
    ManifestEntry entry;
    if (!file.is_object()) {
        return entry;
    }
    entry.name = first_string(file, {"key", "filename"});
    auto links = file.find("links");
    if (links != file.end() && links->is_object()) {
        entry.uri = first_string(*links, {"self", "content", "download"});
    }
    entry.expected_size = first_size(file, {"size", "filesize"});
    entry.checksum = first_string(file, {"checksum"});
    return entry;
}

} // namespace

std::optional<std::string> parse_record_id(std::string_view input) {
    std::string s = trim(input);
    if (!s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return s;
    }

    static const std::regex record_regex(R"(zenodo\.org/records?/(\d+))");
    std::smatch match;
    if (std::regex_search(s, match, record_regex)) {
        return match[1].str();
    }
    return std::nullopt;
}

std::string record_api_url(const std::string& record_id) {
    return "https://zenodo.org/api/records/" + record_id;
}

CatalogRecord parse_record(const std::string& json_text) {
    json doc;
    try {
        doc = json::parse(json_text);
    } catch (const json::parse_error& e) {
        throw ZfetchException(string_format("error.catalog_parse_failed", e.what()));
    }
    if (!doc.is_object()) {
        throw ZfetchException(string_format("error.catalog_parse_failed", std::string("top-level value is not an object")));
    }

    CatalogRecord record;
    auto id = doc.find("id");
    if (id != doc.end()) {
        record.id = id->is_string() ? id->get<std::string>() : id->dump();
    }
    auto metadata = doc.find("metadata");
    if (metadata != doc.end() && metadata->is_object()) {
        record.title = first_string(*metadata, {"title"});
    }

    auto files = doc.find("files");
    if (files != doc.end() && files->is_array()) {
        for (const auto& file : *files) {
            record.entries.push_back(parse_file(file));
        }
    }
    return record;
}

CatalogRecord fetch_record(HttpClient& http, const std::string& record_id) {
    std::string url = record_api_url(record_id);
    log_info(string_format("info.fetching_metadata", url));
    CatalogRecord record = parse_record(fetch_text(http, url));
    if (record.id.empty()) {
        record.id = record_id;
    }
    return record;
}

CatalogRecord load_manifest_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ZfetchException(string_format("error.open_file_failed", path.string()));
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse_record(buffer.str());
}

std::string output_dir_name(const std::string& record_id, const std::string& title) {
    std::string safe;
    for (unsigned char c : title) {
        if (std::isalnum(c) || c == ' ' || c == '-' || c == '_') {
            safe += static_cast<char>(c);
        }
    }
    safe = trim(safe);
    if (safe.empty()) {
        safe = "Untitled_Dataset";
    }
    return "Zenodo_" + record_id + "_" + safe;
}
