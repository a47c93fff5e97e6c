#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>

enum class ProgressMode {
    BAR,
    NONE
};

// Retry, backoff and streaming parameters handed to the batch run.
struct TransferOptions {
    int max_retries = 5;
    std::chrono::milliseconds retry_delay{std::chrono::seconds(5)};
    std::chrono::milliseconds pass_delay{std::chrono::seconds(10)};
    std::size_t chunk_size = 8192;
    std::chrono::seconds connect_timeout{15};
    // Abort a transfer that stays below 1 byte/s for this long.
    std::chrono::seconds low_speed_time{30};
    // 0 keeps passing until every entry converges.
    int max_passes = 0;
    ProgressMode progress = ProgressMode::BAR;
};

inline constexpr std::size_t MIN_CHUNK_SIZE = 1024;
inline constexpr std::size_t MAX_CHUNK_SIZE = 10 * 1024 * 1024;

// Reads "key = value" lines into options. Keys absent from the file keep
// their current value. Throws ZfetchException on unreadable files or bad values.
void load_options_file(const std::filesystem::path& path, TransferOptions& options);

// Throws ZfetchException if options are out of range.
void validate_options(const TransferOptions& options);

ProgressMode parse_progress_mode(const std::string& value);
