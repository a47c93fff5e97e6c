#pragma once

#include "config.hpp"
#include "http_client.hpp"
#include "manifest.hpp"
#include "progress.hpp"
#include "transfer.hpp"

#include <chrono>
#include <filesystem>
#include <functional>

using SleepFunction = std::function<void(std::chrono::milliseconds)>;

void sleep_for(std::chrono::milliseconds delay);

struct RetryResult {
    AttemptOutcome outcome;
    int attempts = 0;
};

// Runs transfer attempts for one entry until one succeeds or
// options.max_retries attempts have been made, pausing options.retry_delay
// between attempts. Every attempt re-reads the resume offset from disk.
RetryResult download_with_retries(const ManifestEntry& entry,
                                  const std::filesystem::path& dest_dir,
                                  const TransferOptions& options,
                                  HttpClient& http,
                                  ProgressReporter& progress,
                                  const SleepFunction& sleep = sleep_for);
