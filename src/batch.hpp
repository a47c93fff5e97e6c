#pragma once

#include "config.hpp"
#include "downloader.hpp"
#include "http_client.hpp"
#include "manifest.hpp"
#include "progress.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

struct PassResult {
    int attempted = 0;
    std::vector<ManifestEntry> failed;
};

enum class RunStatus {
    ALL_SUCCEEDED,
    NO_MATCHING_FILES,
    PASS_LIMIT_REACHED
};

struct RunSummary {
    RunStatus status = RunStatus::ALL_SUCCEEDED;
    int passes = 0;
    // Entries matching the filter in the last pass examined.
    std::size_t matched = 0;
    std::vector<std::size_t> failures_per_pass;
};

// Sweeps the manifest in passes, one entry at a time, until a pass ends
// without failures.
class BatchDownloader {
public:
    BatchDownloader(TransferOptions options, HttpClient& http, ProgressReporter& progress,
                    SleepFunction sleep = sleep_for);

    RunSummary run(const Manifest& manifest, const std::filesystem::path& dest_dir,
                   std::string_view filter = {});

    // Well-formed entries whose name contains the filter, in manifest order.
    std::vector<ManifestEntry> select_matching(const Manifest& manifest, std::string_view filter,
                                               bool report_malformed = false) const;
    // Matching entries not already present at their expected size.
    std::vector<ManifestEntry> select_eligible(const std::vector<ManifestEntry>& matching,
                                               const std::filesystem::path& dest_dir) const;

    PassResult run_pass(const std::vector<ManifestEntry>& eligible, const std::filesystem::path& dest_dir);

private:
    TransferOptions options_;
    HttpClient& http_;
    ProgressReporter& progress_;
    SleepFunction sleep_;
};

// Checks each entry that publishes a checksum against its local file.
// Returns the entries whose digest differs or whose file is missing.
std::vector<ManifestEntry> verify_downloads(const std::vector<ManifestEntry>& entries,
                                            const std::filesystem::path& dest_dir);
