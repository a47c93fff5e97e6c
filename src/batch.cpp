#include "batch.hpp"
#include "exception.hpp"
#include "hash.hpp"
#include "localization.hpp"
#include "transfer.hpp"
#include "utils.hpp"

#include <utility>

namespace fs = std::filesystem;

BatchDownloader::BatchDownloader(TransferOptions options, HttpClient& http, ProgressReporter& progress,
                                 SleepFunction sleep)
    : options_(std::move(options)), http_(http), progress_(progress), sleep_(std::move(sleep)) {
    validate_options(options_);
}

std::vector<ManifestEntry> BatchDownloader::select_matching(const Manifest& manifest, std::string_view filter,
                                                            bool report_malformed) const {
    std::vector<ManifestEntry> matching;
    for (const auto& entry : manifest) {
        if (!is_well_formed(entry)) {
            if (report_malformed) {
                log_warning(string_format("warning.skip_malformed", entry.name, entry.uri));
            }
            continue;
        }
        if (matches_filter(entry, filter)) {
            matching.push_back(entry);
        }
    }
    return matching;
}

std::vector<ManifestEntry> BatchDownloader::select_eligible(const std::vector<ManifestEntry>& matching,
                                                            const fs::path& dest_dir) const {
    std::vector<ManifestEntry> eligible;
    for (const auto& entry : matching) {
        try {
            if (inspect_local(entry, dest_dir).is_complete()) {
                continue;
            }
        } catch (const IoError& e) {
            // The attempt itself will report the problem.
            log_warning(e.what());
        }
        eligible.push_back(entry);
    }
    return eligible;
}

PassResult BatchDownloader::run_pass(const std::vector<ManifestEntry>& eligible, const fs::path& dest_dir) {
    PassResult result;
    for (const auto& entry : eligible) {
        ++result.attempted;
        if (entry.expected_size) {
            log_info(string_format("info.preparing", entry.name, format_bytes(*entry.expected_size)));
        } else {
            log_info(string_format("info.preparing_unknown", entry.name));
        }

        RetryResult retry = download_with_retries(entry, dest_dir, options_, http_, progress_, sleep_);
        if (!retry.outcome.ok()) {
            log_warning(string_format("warning.entry_deferred", entry.name));
            result.failed.push_back(entry);
        }
    }
    return result;
}

RunSummary BatchDownloader::run(const Manifest& manifest, const fs::path& dest_dir, std::string_view filter) {
    ensure_dir_exists(dest_dir);

    RunSummary summary;
    for (int pass = 1;; ++pass) {
        summary.passes = pass;
        log_info(string_format("info.pass_start", pass));

        auto matching = select_matching(manifest, filter, pass == 1);
        summary.matched = matching.size();
        if (matching.empty() && pass == 1) {
            log_info(get_string("info.no_matching_files"));
            summary.status = RunStatus::NO_MATCHING_FILES;
            return summary;
        }

        auto eligible = select_eligible(matching, dest_dir);
        if (eligible.empty()) {
            log_info(string_format("info.all_succeeded", matching.size()));
            summary.status = RunStatus::ALL_SUCCEEDED;
            return summary;
        }

        PassResult result = run_pass(eligible, dest_dir);
        summary.failures_per_pass.push_back(result.failed.size());

        if (result.failed.empty()) {
            log_info(string_format("info.all_succeeded", matching.size()));
            summary.status = RunStatus::ALL_SUCCEEDED;
            return summary;
        }

        log_warning(string_format("warning.pass_failures", pass, result.failed.size(), result.attempted));
        if (options_.max_passes > 0 && pass >= options_.max_passes) {
            log_error(string_format("error.pass_limit", options_.max_passes));
            summary.status = RunStatus::PASS_LIMIT_REACHED;
            return summary;
        }

        auto seconds = std::chrono::duration_cast<std::chrono::duration<double>>(options_.pass_delay).count();
        log_info(string_format("info.next_pass_in", seconds));
        sleep_(options_.pass_delay);
    }
}

std::vector<ManifestEntry> verify_downloads(const std::vector<ManifestEntry>& entries, const fs::path& dest_dir) {
    std::vector<ManifestEntry> mismatched;
    for (const auto& entry : entries) {
        if (entry.checksum.empty()) continue;

        fs::path path = dest_dir / entry.name;
        if (!fs::exists(path)) {
            log_error(string_format("error.open_file_failed", path.string()));
            mismatched.push_back(entry);
            continue;
        }
        if (verify_checksum(path, entry.checksum)) {
            log_info(string_format("info.checksum_ok", entry.name));
        } else {
            log_error(string_format("error.checksum_mismatch", entry.name, entry.checksum));
            mismatched.push_back(entry);
        }
    }
    return mismatched;
}
