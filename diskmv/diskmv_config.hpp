#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

// -----------------------------------------------------------------------------
// System constants and configuration boundaries
// -----------------------------------------------------------------------------
namespace constants {
    constexpr size_t DEFAULT_COPY_CHUNK_KB = 1024;
    constexpr size_t MIN_COPY_CHUNK_KB = 4;
    constexpr size_t MAX_COPY_CHUNK_KB = 65536;
    constexpr size_t MAX_DIRECTORY_DEPTH = 256;
    constexpr int DEFAULT_MAX_DISK = 28;
    constexpr int MAX_DISK_LIMIT = 999;
    constexpr uint64_t KIB = 1024;
}

// -----------------------------------------------------------------------------
// Environment-based configuration
// -----------------------------------------------------------------------------
struct Config {
    std::string mnt_root = "/mnt";
    std::string share_root = "user";
    std::string disk_prefix = "disk";
    int min_disk = 1;
    int max_disk = constants::DEFAULT_MAX_DISK;
    std::vector<std::string> cache_names{"cache"};
    bool require_mountpoint = false;
    bool fsync_before_delete = true;
    bool use_copy_file_range = true;
    size_t copy_chunk_kb = constants::DEFAULT_COPY_CHUNK_KB;
    uint64_t reserve_mb = 0;
    bool use_syslog = true;
    std::string proc_root = "/proc";

    std::string share_root_path() const;

    uint64_t reserve_bytes() const noexcept {
        return reserve_mb * 1024ULL * 1024;
    }
};

// Reads DISKMV_* variables over the defaults. Returns nullptr (after logging the
// reason) when the result is unusable.
std::shared_ptr<const Config> diskmv_load_config_from_env() noexcept;

std::vector<std::string> diskmv_split_list(const std::string& list, char sep);
