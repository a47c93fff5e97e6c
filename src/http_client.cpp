#include "http_client.hpp"
#include "exception.hpp"
#include "localization.hpp"

#include <curl/curl.h>

#include <exception>
#include <memory>

namespace {

// Custom deleter for the CURL handle
struct CurlDeleter {
    void operator()(CURL* curl) const {
        if (curl) {
            curl_easy_cleanup(curl);
        }
    }
};
using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;

struct TransferContext {
    CURL* curl = nullptr;
    const HttpClient::ResponseHandler* on_response = nullptr;
    const HttpClient::DataHandler* on_data = nullptr;
    bool response_seen = false;
    // Handler exceptions must not unwind through libcurl; they are parked
    // here and rethrown once curl_easy_perform has returned.
    std::exception_ptr error;
};

HttpResponseInfo query_response(CURL* curl) {
    HttpResponseInfo info;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &info.status);
    curl_off_t length = -1;
    if (curl_easy_getinfo(curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length) == CURLE_OK && length >= 0) {
        info.content_length = static_cast<std::uint64_t>(length);
    }
    return info;
}

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<TransferContext*>(userdata);
    size_t bytes = size * nmemb;
    try {
        if (!ctx->response_seen) {
            ctx->response_seen = true;
            (*ctx->on_response)(query_response(ctx->curl));
        }
        if (bytes > 0) {
            (*ctx->on_data)(ptr, bytes);
        }
    } catch (...) {
        ctx->error = std::current_exception();
        return bytes == 0 ? 1 : 0;
    }
    return bytes;
}

} // namespace

CurlHttpClient::CurlHttpClient(const TransferOptions& options)
    : buffer_size_(options.chunk_size),
      connect_timeout_(static_cast<long>(options.connect_timeout.count())),
      low_speed_time_(static_cast<long>(options.low_speed_time.count())) {}

void CurlHttpClient::get(const HttpRequest& request,
                         const ResponseHandler& on_response,
                         const DataHandler& on_data) {
    CurlHandle curl(curl_easy_init());
    if (!curl) {
        throw NetworkError(string_format("error.curl_init_failed", request.url));
    }

    TransferContext ctx;
    ctx.curl = curl.get();
    ctx.on_response = &on_response;
    ctx.on_data = &on_data;

    char error_buffer[CURL_ERROR_SIZE] = {0};
    std::string range;

    curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "zfetch/" ZFETCH_VERSION);
    curl_easy_setopt(curl.get(), CURLOPT_BUFFERSIZE, static_cast<long>(buffer_size_));
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, connect_timeout_);
    if (low_speed_time_ > 0) {
        curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_TIME, low_speed_time_);
    }
    if (request.range_start) {
        range = std::to_string(*request.range_start) + "-";
        curl_easy_setopt(curl.get(), CURLOPT_RANGE, range.c_str());
    }

    CURLcode res = curl_easy_perform(curl.get());

    if (ctx.error) {
        std::rethrow_exception(ctx.error);
    }

    if (res != CURLE_OK) {
        std::string detail = error_buffer[0] != '\0' ? error_buffer : curl_easy_strerror(res);
        if (res == CURLE_HTTP_RETURNED_ERROR) {
            long status = 0;
            curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
            throw NetworkError(string_format("error.http_status", request.url, status));
        }
        throw NetworkError(string_format("error.download_failed", request.url) + ": " + detail);
    }

    if (!ctx.response_seen) {
        on_response(query_response(curl.get()));
    }
}

std::string fetch_text(HttpClient& client, const std::string& url) {
    std::string body;
    client.get(HttpRequest{url, std::nullopt},
        [&](const HttpResponseInfo& info) {
            if (info.status != 200) {
                throw NetworkError(string_format("error.http_status", url, info.status));
            }
        },
        [&](const char* data, std::size_t size) {
            body.append(data, size);
        });
    return body;
}
