#pragma once

#include "config.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

struct HttpRequest {
    std::string url;
    // When set, the request carries "Range: bytes=<range_start>-".
    std::optional<std::uint64_t> range_start;
};

struct HttpResponseInfo {
    long status = 0;
    std::optional<std::uint64_t> content_length;
};

// Streaming HTTP GET. Implementations call on_response exactly once, before
// the first body chunk (or after the transfer for an empty body), then
// on_data for each received chunk. An exception thrown by a handler aborts
// the transfer and propagates out of get(). Transport failures and error
// statuses throw NetworkError.
class HttpClient {
public:
    using ResponseHandler = std::function<void(const HttpResponseInfo&)>;
    using DataHandler = std::function<void(const char* data, std::size_t size)>;

    virtual ~HttpClient() = default;

    virtual void get(const HttpRequest& request,
                     const ResponseHandler& on_response,
                     const DataHandler& on_data) = 0;
};

class CurlHttpClient : public HttpClient {
public:
    explicit CurlHttpClient(const TransferOptions& options);

    void get(const HttpRequest& request,
             const ResponseHandler& on_response,
             const DataHandler& on_data) override;

private:
    std::size_t buffer_size_;
    long connect_timeout_;
    long low_speed_time_;
};

// Whole-body GET for small documents such as catalog metadata.
// Anything but a 200 answer throws NetworkError.
std::string fetch_text(HttpClient& client, const std::string& url);
