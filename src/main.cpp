#include "batch.hpp"
#include "catalog.hpp"
#include "config.hpp"
#include "exception.hpp"
#include "http_client.hpp"
#include "localization.hpp"
#include "progress.hpp"
#include "utils.hpp"
#include <cxxopts.hpp>

#include <curl/curl.h>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

namespace fs = std::filesystem;

// RAII for curl global init/cleanup
struct CurlGlobalInitializer {
    CurlGlobalInitializer() {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    }
    ~CurlGlobalInitializer() {
        curl_global_cleanup();
    }
};

void print_usage(const cxxopts::Options& options) {
    std::cerr << options.help({""});
    std::cerr << get_string("info.usage_examples") << std::endl;
}

TransferOptions resolve_options(const cxxopts::ParseResult& result) {
    TransferOptions options;
    if (result.count("config")) {
        load_options_file(result["config"].as<std::string>(), options);
    }
    if (result.count("retries")) {
        options.max_retries = result["retries"].as<int>();
    }
    if (result.count("retry-delay")) {
        options.retry_delay = std::chrono::seconds(result["retry-delay"].as<unsigned>());
    }
    if (result.count("pass-delay")) {
        options.pass_delay = std::chrono::seconds(result["pass-delay"].as<unsigned>());
    }
    if (result.count("max-passes")) {
        options.max_passes = result["max-passes"].as<int>();
    }
    if (result.count("chunk-size")) {
        options.chunk_size = result["chunk-size"].as<std::size_t>();
    }
    if (result["no-progress"].as<bool>()) {
        options.progress = ProgressMode::NONE;
    }
    validate_options(options);
    return options;
}

CatalogRecord resolve_catalog(const cxxopts::ParseResult& result, HttpClient& http) {
    if (result.count("manifest")) {
        return load_manifest_file(result["manifest"].as<std::string>());
    }
    if (!result.count("record")) {
        throw ZfetchException(get_string("error.no_record"));
    }
    const auto& input = result["record"].as<std::string>();
    auto record_id = parse_record_id(input);
    if (!record_id) {
        throw ZfetchException(string_format("error.bad_record_id", input));
    }
    log_info(string_format("info.record_id", *record_id));
    return fetch_record(http, *record_id);
}

int main(int argc, char* argv[]) {
    CurlGlobalInitializer curl_initializer;
    try {
        init_localization();

        cxxopts::Options options(argv[0]);
        options.custom_help(get_string("info.usage"));
        options.positional_help("<record-url-or-id>");
        options.set_width(100);

        options.add_options()
            ("h,help", get_string("help.help"))
            ("f,filter", get_string("help.filter"), cxxopts::value<std::string>()->default_value(""))
            ("o,output", get_string("help.output"), cxxopts::value<std::string>())
            ("c,config", get_string("help.config"), cxxopts::value<std::string>())
            ("manifest", get_string("help.manifest"), cxxopts::value<std::string>())
            ("retries", get_string("help.retries"), cxxopts::value<int>())
            ("retry-delay", get_string("help.retry_delay"), cxxopts::value<unsigned>())
            ("pass-delay", get_string("help.pass_delay"), cxxopts::value<unsigned>())
            ("max-passes", get_string("help.max_passes"), cxxopts::value<int>())
            ("chunk-size", get_string("help.chunk_size"), cxxopts::value<std::size_t>())
            ("no-progress", get_string("help.no_progress"), cxxopts::value<bool>()->default_value("false"))
            ("verify", get_string("help.verify"), cxxopts::value<bool>()->default_value("false"))
            ("record", "", cxxopts::value<std::string>());

        options.parse_positional({"record"});

        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            print_usage(options);
            return 0;
        }

        if (!result.count("record") && !result.count("manifest")) {
            print_usage(options);
            return 1;
        }

        TransferOptions transfer_options = resolve_options(result);
        CurlHttpClient http(transfer_options);

        CatalogRecord record = resolve_catalog(result, http);

        fs::path dest_dir;
        if (result.count("output")) {
            dest_dir = result["output"].as<std::string>();
        } else {
            dest_dir = fs::current_path() / output_dir_name(record.id.empty() ? "local" : record.id, record.title);
        }
        if (fs::exists(dest_dir)) {
            log_info(string_format("info.using_dir", dest_dir.string()));
        } else {
            ensure_dir_exists(dest_dir);
            log_info(string_format("info.created_dir", dest_dir.string()));
        }
        DirLock dir_lock(dest_dir);
        log_info(string_format("info.found_files", record.entries.size()));

        auto progress = make_progress_reporter(transfer_options.progress);
        BatchDownloader downloader(transfer_options, http, *progress);
        const std::string filter = result["filter"].as<std::string>();

        RunSummary summary = downloader.run(record.entries, dest_dir, filter);

        switch (summary.status) {
            case RunStatus::NO_MATCHING_FILES:
                return 0;
            case RunStatus::PASS_LIMIT_REACHED:
                return 1;
            case RunStatus::ALL_SUCCEEDED:
                break;
        }

        if (result["verify"].as<bool>()) {
            auto matching = downloader.select_matching(record.entries, filter);
            auto mismatched = verify_downloads(matching, dest_dir);
            if (!mismatched.empty()) {
                log_error(string_format("error.verify_failed", mismatched.size()));
                return 1;
            }
        }

        log_info(get_string("info.all_tasks_completed"));

    } catch (const cxxopts::exceptions::exception& e) {
        log_error(string_format("error.cmd_parse_error", e.what()));
        return 1;
    } catch (const ZfetchException& e) {
        log_error(string_format("error.zfetch_error", e.what()));
        return 1;
    } catch (const std::exception& e) {
        log_error(string_format("error.unexpected_error", e.what()));
        return 1;
    }

    return 0;
}
