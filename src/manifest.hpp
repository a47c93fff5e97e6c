#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

struct ManifestEntry {
    std::string name;
    std::string uri;
    std::optional<std::uint64_t> expected_size;
    // "<algorithm>:<hex digest>", empty when the catalog publishes none.
    std::string checksum;

    bool operator==(const ManifestEntry&) const = default;
};

using Manifest = std::vector<ManifestEntry>;

// An entry the engine can act on: it has a uri and a name usable as a
// single filename component.
bool is_well_formed(const ManifestEntry& entry);

// Case-insensitive substring match; an empty filter matches everything.
bool matches_filter(const ManifestEntry& entry, std::string_view filter);
