#include "transfer.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace {

void discard_local(const fs::path& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        throw IoError(string_format("error.remove_failed", path.string()) + ": " + ec.message());
    }
}

void open_output(std::ofstream& out, const fs::path& path, bool append) {
    auto mode = std::ios::binary | (append ? std::ios::app : std::ios::trunc);
    out.open(path, mode);
    if (!out) {
        throw IoError(string_format("error.create_file_failed", path.string()));
    }
}

AttemptOutcome make_outcome(AttemptStatus status, const fs::path& path, std::uint64_t fallback, std::string message) {
    AttemptOutcome outcome;
    outcome.status = status;
    outcome.message = std::move(message);
    outcome.bytes = fallback;
    try {
        outcome.bytes = local_file_size(path).value_or(0);
    } catch (const IoError&) {
        // keep the in-memory count
    }
    return outcome;
}

} // namespace

std::string to_string(AttemptStatus status) {
    switch (status) {
        case AttemptStatus::SUCCESS: return "success";
        case AttemptStatus::SIZE_MISMATCH: return "size mismatch";
        case AttemptStatus::NETWORK_ERROR: return "network error";
        case AttemptStatus::IO_ERROR: return "I/O error";
    }
    return "unknown";
}

TransferState inspect_local(const ManifestEntry& entry, const fs::path& dest_dir) {
    TransferState state;
    state.local_path = dest_dir / entry.name;
    state.expected_size = entry.expected_size;
    auto size = local_file_size(state.local_path);
    state.exists = size.has_value();
    state.bytes_present = size.value_or(0);
    state.mode = state.bytes_present > 0 ? TransferMode::RESUME : TransferMode::FRESH;
    return state;
}

AttemptOutcome run_transfer(const ManifestEntry& entry,
                            const fs::path& dest_dir,
                            HttpClient& http,
                            ProgressReporter& progress) {
    fs::path local_path = dest_dir / entry.name;
    std::uint64_t bytes_done = 0;
    bool progress_open = false;

    try {
        TransferState state = inspect_local(entry, dest_dir);
        bytes_done = state.bytes_present;

        if (state.is_complete()) {
            log_info(string_format("info.already_complete", entry.name));
            return AttemptOutcome{AttemptStatus::SUCCESS, state.bytes_present, {}};
        }

        if (state.is_oversized()) {
            log_warning(string_format("warning.local_oversized", entry.name, state.bytes_present, *state.expected_size));
            discard_local(state.local_path);
            state.exists = false;
            state.bytes_present = 0;
            state.mode = TransferMode::FRESH;
            bytes_done = 0;
        } else if (state.mode == TransferMode::RESUME) {
            log_info(string_format("info.resuming", entry.name, state.bytes_present));
        }

        HttpRequest request{entry.uri, std::nullopt};
        if (state.mode == TransferMode::RESUME) {
            request.range_start = state.bytes_present;
        }

        std::ofstream out;
        http.get(request,
            [&](const HttpResponseInfo& info) {
                std::optional<std::uint64_t> total = entry.expected_size;
                if (info.status == 206) {
                    if (!total && info.content_length) {
                        total = *info.content_length + state.bytes_present;
                    }
                    open_output(out, state.local_path, request.range_start.has_value());
                } else if (info.status == 200) {
                    if (request.range_start) {
                        log_warning(string_format("warning.range_ignored", entry.name));
                        state.bytes_present = 0;
                        state.mode = TransferMode::FRESH;
                        bytes_done = 0;
                    }
                    if (!total) {
                        total = info.content_length;
                    }
                    open_output(out, state.local_path, false);
                } else {
                    throw NetworkError(string_format("error.http_status", entry.uri, info.status));
                }
                progress.begin(entry.name, state.bytes_present, total);
                progress_open = true;
            },
            [&](const char* data, std::size_t size) {
                out.write(data, static_cast<std::streamsize>(size));
                if (!out) {
                    throw IoError(string_format("error.write_failed", state.local_path.string()));
                }
                bytes_done += size;
                progress.update(size);
            });

        out.close();
        if (out.fail()) {
            throw IoError(string_format("error.write_failed", state.local_path.string()));
        }
        if (progress_open) {
            progress.close();
            progress_open = false;
        }

        std::uint64_t final_size = local_file_size(state.local_path).value_or(0);
        if (entry.expected_size && final_size != *entry.expected_size) {
            return AttemptOutcome{AttemptStatus::SIZE_MISMATCH, final_size,
                                  string_format("error.size_mismatch", entry.name, final_size, *entry.expected_size)};
        }

        log_info(string_format("info.download_complete", entry.name));
        return AttemptOutcome{AttemptStatus::SUCCESS, final_size, {}};
    } catch (const NetworkError& e) {
        if (progress_open) progress.close();
        return make_outcome(AttemptStatus::NETWORK_ERROR, local_path, bytes_done, e.what());
    } catch (const IoError& e) {
        if (progress_open) progress.close();
        return make_outcome(AttemptStatus::IO_ERROR, local_path, bytes_done, e.what());
    } catch (const fs::filesystem_error& e) {
        if (progress_open) progress.close();
        return make_outcome(AttemptStatus::IO_ERROR, local_path, bytes_done, e.what());
    }
}
