#pragma once

#include "exception.hpp"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace fs = std::filesystem;

// Color codes
inline constexpr std::string_view COLOR_GREEN = "\033[1;32m";
inline constexpr std::string_view COLOR_WHITE = "\033[1;37m";
inline constexpr std::string_view COLOR_YELLOW = "\033[1;33m";
inline constexpr std::string_view COLOR_RED = "\033[1;31m";
inline constexpr std::string_view COLOR_RESET = "\033[0m";

// Log functions
void log_info(std::string_view msg);
void log_warning(std::string_view msg);
void log_error(std::string_view msg);

bool stdout_is_tty();

// Exclusive advisory lock on a destination directory, held for the lifetime
// of the object. Keeps two runs from writing into the same directory.
class DirLock {
public:
    explicit DirLock(const fs::path& dir);
    ~DirLock();
    DirLock(const DirLock&) = delete;
    DirLock& operator=(const DirLock&) = delete;
private:
    int lock_fd = -1;
};

// Filesystem utilities
void ensure_dir_exists(const fs::path& path);

// Size of a regular file, or nullopt if nothing is there.
// Throws IoError if the path exists but cannot be inspected.
std::optional<std::uint64_t> local_file_size(const fs::path& path);

// A single path component that stays inside the destination directory.
bool is_valid_filename(std::string_view name);

// String helpers
std::string to_lower(std::string_view s);
bool contains_icase(std::string_view haystack, std::string_view needle);
std::string trim(std::string_view s);
std::string format_bytes(std::uint64_t bytes);
