#pragma once

#include "http_client.hpp"
#include "manifest.hpp"
#include "progress.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

enum class TransferMode {
    FRESH,
    RESUME
};

// Snapshot of the local side of one entry, taken from the filesystem at the
// start of every attempt.
struct TransferState {
    std::filesystem::path local_path;
    bool exists = false;
    std::uint64_t bytes_present = 0;
    std::optional<std::uint64_t> expected_size;
    TransferMode mode = TransferMode::FRESH;

    bool is_complete() const {
        return exists && expected_size && bytes_present == *expected_size;
    }
    bool is_oversized() const {
        return expected_size && bytes_present > *expected_size;
    }
};

enum class AttemptStatus {
    SUCCESS,
    SIZE_MISMATCH,
    NETWORK_ERROR,
    IO_ERROR
};

struct AttemptOutcome {
    AttemptStatus status = AttemptStatus::SUCCESS;
    // Local file size once the attempt ended.
    std::uint64_t bytes = 0;
    std::string message;

    bool ok() const { return status == AttemptStatus::SUCCESS; }
};

std::string to_string(AttemptStatus status);

// Throws IoError if the local path cannot be inspected.
TransferState inspect_local(const ManifestEntry& entry, const std::filesystem::path& dest_dir);

// One download attempt. Never throws for network, size or local I/O
// problems; those come back as the outcome status.
AttemptOutcome run_transfer(const ManifestEntry& entry,
                            const std::filesystem::path& dest_dir,
                            HttpClient& http,
                            ProgressReporter& progress);
