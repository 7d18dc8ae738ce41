#include "diskmv_config.hpp"
#include "diskmv_io.hpp"
#include "diskmv_log.hpp"

#include <cstdlib>
#include <cstring>
#include <new>
#include <stdexcept>

std::string Config::share_root_path() const {
    return diskmv_join_path(mnt_root, share_root);
}

std::vector<std::string> diskmv_split_list(const std::string& list, char sep) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= list.size()) {
        size_t end = list.find(sep, start);
        if (end == std::string::npos) end = list.size();
        std::string item = list.substr(start, end - start);
        size_t b = item.find_first_not_of(" \t");
        size_t e = item.find_last_not_of(" \t");
        if (b != std::string::npos) {
            out.push_back(item.substr(b, e - b + 1));
        }
        start = end + 1;
    }
    return out;
}

std::shared_ptr<const Config> diskmv_load_config_from_env() noexcept {
    std::shared_ptr<Config> cfg;
    try {
        cfg = std::make_shared<Config>();

        if (const char* v = getenv("DISKMV_MNT_ROOT")) cfg->mnt_root = v;
        if (const char* v = getenv("DISKMV_SHARE_ROOT")) cfg->share_root = v;
        if (const char* v = getenv("DISKMV_DISK_PREFIX")) cfg->disk_prefix = v;
        if (const char* v = getenv("DISKMV_PROC_ROOT")) cfg->proc_root = v;
        if (const char* v = getenv("DISKMV_CACHE_NAMES")) cfg->cache_names = diskmv_split_list(v, ',');
    } catch (const std::bad_alloc&) {
        DISKMV_LOG_ERROR("config", "Out of memory while loading configuration");
        return nullptr;
    }

    auto safe_stoull = [](const char* v, uint64_t default_val) -> uint64_t {
        if (!v) return default_val;
        try {
            return std::stoull(v);
        } catch (const std::logic_error&) {
            DISKMV_LOG_WARN("config", "Ignoring non-numeric value '%s'", v);
            return default_val;
        }
    };

    auto safe_stoi = [](const char* v, int default_val) -> int {
        if (!v) return default_val;
        try {
            return std::stoi(v);
        } catch (const std::logic_error&) {
            DISKMV_LOG_WARN("config", "Ignoring non-numeric value '%s'", v);
            return default_val;
        }
    };

    auto parse_bool = [](const char* v, bool default_val) -> bool {
        if (!v) return default_val;
        return strcmp(v, "0") != 0 && strcmp(v, "false") != 0 && strcmp(v, "no") != 0;
    };

    cfg->min_disk = safe_stoi(getenv("DISKMV_MIN_DISK"), cfg->min_disk);
    cfg->max_disk = safe_stoi(getenv("DISKMV_MAX_DISK"), cfg->max_disk);
    cfg->copy_chunk_kb = safe_stoull(getenv("DISKMV_COPY_CHUNK_KB"), cfg->copy_chunk_kb);
    cfg->reserve_mb = safe_stoull(getenv("DISKMV_RESERVE_MB"), cfg->reserve_mb);

    cfg->require_mountpoint = parse_bool(getenv("DISKMV_REQUIRE_MOUNTPOINT"), cfg->require_mountpoint);
    cfg->fsync_before_delete = parse_bool(getenv("DISKMV_FSYNC"), cfg->fsync_before_delete);
    cfg->use_copy_file_range = parse_bool(getenv("DISKMV_USE_COPY_FILE_RANGE"), cfg->use_copy_file_range);
    cfg->use_syslog = parse_bool(getenv("DISKMV_USE_SYSLOG"), cfg->use_syslog);

    // Validation
    if (cfg->mnt_root.empty() || cfg->mnt_root[0] != '/') {
        DISKMV_LOG_ERROR("config", "DISKMV_MNT_ROOT must be an absolute path: '%s'", cfg->mnt_root.c_str());
        return nullptr;
    }

    if (cfg->share_root.empty() || cfg->share_root.find('/') != std::string::npos) {
        DISKMV_LOG_ERROR("config", "DISKMV_SHARE_ROOT must be a single directory name: '%s'",
                         cfg->share_root.c_str());
        return nullptr;
    }

    if (cfg->disk_prefix.empty() || cfg->disk_prefix.find('/') != std::string::npos) {
        DISKMV_LOG_ERROR("config", "DISKMV_DISK_PREFIX must be a non-empty name: '%s'",
                         cfg->disk_prefix.c_str());
        return nullptr;
    }

    while (cfg->mnt_root.size() > 1 && cfg->mnt_root.back() == '/') {
        cfg->mnt_root.pop_back();
    }

    // Clamping
    if (cfg->min_disk < 0) cfg->min_disk = 0;
    if (cfg->max_disk > constants::MAX_DISK_LIMIT) cfg->max_disk = constants::MAX_DISK_LIMIT;
    if (cfg->max_disk < cfg->min_disk) cfg->max_disk = cfg->min_disk;
    if (cfg->copy_chunk_kb < constants::MIN_COPY_CHUNK_KB) cfg->copy_chunk_kb = constants::MIN_COPY_CHUNK_KB;
    if (cfg->copy_chunk_kb > constants::MAX_COPY_CHUNK_KB) cfg->copy_chunk_kb = constants::MAX_COPY_CHUNK_KB;

    return cfg;
}
