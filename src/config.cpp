#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <fstream>
#include <functional>
#include <limits>
#include <map>
#include <string_view>

namespace fs = std::filesystem;

namespace {
    long long parse_integer(const std::string& key, const std::string& value) {
        size_t consumed = 0;
        long long result = 0;
        try {
            result = std::stoll(value, &consumed);
        } catch (const std::exception&) {
            throw ZfetchException(string_format("error.config_bad_value", key, value));
        }
        if (consumed != value.size() || result < 0) {
            throw ZfetchException(string_format("error.config_bad_value", key, value));
        }
        return result;
    }

    int parse_int(const std::string& key, const std::string& value) {
        long long v = parse_integer(key, value);
        if (v > std::numeric_limits<int>::max()) {
            throw ZfetchException(string_format("error.config_bad_value", key, value));
        }
        return static_cast<int>(v);
    }
}

ProgressMode parse_progress_mode(const std::string& value) {
    std::string v = to_lower(value);
    if (v == "bar") return ProgressMode::BAR;
    if (v == "none") return ProgressMode::NONE;
    throw ZfetchException(string_format("error.config_bad_value", std::string("progress"), value));
}

void load_options_file(const fs::path& path, TransferOptions& options) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ZfetchException(string_format("error.open_file_failed", path.string()));
    }

    using Setter = std::function<void(const std::string&, const std::string&)>;
    const std::map<std::string, Setter, std::less<>> setters = {
        {"max_retries", [&](const auto& k, const auto& v) { options.max_retries = parse_int(k, v); }},
        {"retry_delay", [&](const auto& k, const auto& v) { options.retry_delay = std::chrono::seconds(parse_integer(k, v)); }},
        {"pass_delay", [&](const auto& k, const auto& v) { options.pass_delay = std::chrono::seconds(parse_integer(k, v)); }},
        {"chunk_size", [&](const auto& k, const auto& v) { options.chunk_size = static_cast<std::size_t>(parse_integer(k, v)); }},
        {"connect_timeout", [&](const auto& k, const auto& v) { options.connect_timeout = std::chrono::seconds(parse_integer(k, v)); }},
        {"low_speed_time", [&](const auto& k, const auto& v) { options.low_speed_time = std::chrono::seconds(parse_integer(k, v)); }},
        {"max_passes", [&](const auto& k, const auto& v) { options.max_passes = parse_int(k, v); }},
        {"progress", [&](const auto&, const auto& v) { options.progress = parse_progress_mode(v); }},
    };

    std::string line;
    int line_no = 0;
    while (std::getline(file, line)) {
        ++line_no;
        std::string stripped = trim(line);
        if (stripped.empty() || stripped[0] == '#') continue;

        size_t pos = stripped.find('=');
        if (pos == std::string::npos) {
            throw ZfetchException(string_format("error.config_syntax", path.string(), line_no));
        }
        std::string key = trim(std::string_view(stripped).substr(0, pos));
        std::string value = trim(std::string_view(stripped).substr(pos + 1));

        auto it = setters.find(key);
        if (it == setters.end()) {
            log_warning(string_format("warning.config_unknown_key", key, path.string()));
            continue;
        }
        it->second(key, value);
    }

    validate_options(options);
}

void validate_options(const TransferOptions& options) {
    if (options.max_retries < 1) {
        throw ZfetchException(string_format("error.config_bad_value", std::string("max_retries"), options.max_retries));
    }
    if (options.chunk_size < MIN_CHUNK_SIZE || options.chunk_size > MAX_CHUNK_SIZE) {
        throw ZfetchException(string_format("error.config_bad_value", std::string("chunk_size"), options.chunk_size));
    }
    if (options.max_passes < 0) {
        throw ZfetchException(string_format("error.config_bad_value", std::string("max_passes"), options.max_passes));
    }
}
