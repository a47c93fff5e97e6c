#include "downloader.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <thread>

void sleep_for(std::chrono::milliseconds delay) {
    if (delay.count() > 0) {
        std::this_thread::sleep_for(delay);
    }
}

RetryResult download_with_retries(const ManifestEntry& entry,
                                  const std::filesystem::path& dest_dir,
                                  const TransferOptions& options,
                                  HttpClient& http,
                                  ProgressReporter& progress,
                                  const SleepFunction& sleep) {
    RetryResult result;
    for (int attempt = 1; attempt <= options.max_retries; ++attempt) {
        result.attempts = attempt;
        result.outcome = run_transfer(entry, dest_dir, http, progress);
        if (result.outcome.ok()) {
            return result;
        }

        log_warning(string_format("warning.attempt_failed", entry.name, attempt, options.max_retries,
                                  to_string(result.outcome.status), result.outcome.message));
        if (attempt < options.max_retries) {
            auto seconds = std::chrono::duration_cast<std::chrono::duration<double>>(options.retry_delay).count();
            log_info(string_format("info.retrying_in", seconds));
            sleep(options.retry_delay);
        }
    }

    log_error(string_format("error.retries_exhausted", entry.name, options.max_retries));
    return result;
}
