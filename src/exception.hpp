#pragma once

#include <stdexcept>
#include <string>

class ZfetchException : public std::runtime_error {
public:
    explicit ZfetchException(const std::string& message)
        : std::runtime_error(message) {}
};

// Connection failures, timeouts and unexpected HTTP status codes.
class NetworkError : public ZfetchException {
public:
    explicit NetworkError(const std::string& message)
        : ZfetchException(message) {}
};

// Local read/write failures.
class IoError : public ZfetchException {
public:
    explicit IoError(const std::string& message)
        : ZfetchException(message) {}
};
