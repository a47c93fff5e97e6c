#include "localization.hpp"
#include "utils.hpp"
#include <cstdlib>
#include <fstream>
#include <string>
#include <unordered_map>

namespace fs = std::filesystem;

namespace {
    fs::path l10n_dir = ZFETCH_L10N_DIR;
    std::unordered_map<std::string, std::string> translations;
    std::unordered_map<std::string, std::string> missing_key_placeholders;

    void load_strings(const std::string& lang) {
        fs::path file_path = l10n_dir / (lang + ".txt");
        std::ifstream file(file_path);
        if (!file.is_open()) {
            if (lang != "en") { // Avoid infinite recursion
                log_warning("Could not open localization file for " + lang + ", falling back to English.");
                load_strings("en");
            }
            return;
        }

        std::string line;
        while (std::getline(file, line)) {
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (line.empty() || line[0] == '#') continue;
            size_t pos = line.find('=');
            if (pos != std::string::npos) {
                translations[line.substr(0, pos)] = line.substr(pos + 1);
            }
        }
    }
}

void set_l10n_dir(const fs::path& dir) {
    l10n_dir = dir;
}

void init_localization() {
    translations.clear();
    const char* lang_env = std::getenv("LANG");
    std::string lang = "en";
    if (lang_env && std::string(lang_env).starts_with("zh")) {
        lang = "zh";
    }
    load_strings(lang);
}

const std::string& get_string(const std::string& key) {
    auto it = translations.find(key);
    if (it != translations.end()) {
        return it->second;
    }
    auto missing_it = missing_key_placeholders.find(key);
    if (missing_it == missing_key_placeholders.end()) {
        missing_it = missing_key_placeholders.emplace(key, "[MISSING_STRING: " + key + "]").first;
    }
    return missing_it->second;
}
