#include "manifest.hpp"
#include "utils.hpp"

bool is_well_formed(const ManifestEntry& entry) {
    return !entry.uri.empty() && is_valid_filename(entry.name);
}

bool matches_filter(const ManifestEntry& entry, std::string_view filter) {
    return filter.empty() || contains_icase(entry.name, filter);
}
