#include "diskmv_volume.hpp"
#include "diskmv_io.hpp"
#include "diskmv_log.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>

#include <sys/stat.h>

bool MountRootVolumeLookup::accepts(const std::string& id) const {
    if (std::find(cfg_.cache_names.begin(), cfg_.cache_names.end(), id) != cfg_.cache_names.end()) {
        return true;
    }

    const std::string& prefix = cfg_.disk_prefix;
    if (id.size() <= prefix.size() || id.compare(0, prefix.size(), prefix) != 0) {
        return false;
    }

    std::string digits = id.substr(prefix.size());
    if (digits.size() > 3) return false;
    if (!std::all_of(digits.begin(), digits.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return false;
    }
    if (digits.size() > 1 && digits[0] == '0') return false;

    int n = std::stoi(digits);
    return n >= cfg_.min_disk && n <= cfg_.max_disk;
}

std::string MountRootVolumeLookup::mount_point(const std::string& id) const {
    return diskmv_join_path(cfg_.mnt_root, id);
}

std::vector<std::string> MountRootVolumeLookup::known_volumes() const {
    std::vector<std::string> ids;
    for (int n = cfg_.min_disk; n <= cfg_.max_disk; ++n) {
        ids.push_back(cfg_.disk_prefix + std::to_string(n));
    }
    for (const auto& name : cfg_.cache_names) {
        ids.push_back(name);
    }
    return ids;
}

std::string diskmv_bare_disk_id(const std::string& input, const Config& cfg) {
    std::string s = input;
    const std::string root_prefix = cfg.mnt_root + "/";

    if (s.compare(0, root_prefix.size(), root_prefix) == 0) {
        s.erase(0, root_prefix.size());
    }

    size_t first = s.find_first_not_of('/');
    if (first == std::string::npos) return std::string();
    s.erase(0, first);

    size_t slash = s.find('/');
    if (slash != std::string::npos) {
        s.erase(slash);
    }
    return s;
}

// Device of a mount point differs from the device of its parent directory.
static bool diskmv_is_mountpoint(const std::string& path, const struct stat& st) noexcept {
    struct stat parent{};
    std::string parent_path = diskmv_join_path(path, "..");
    if (stat(parent_path.c_str(), &parent) != 0) {
        return false;
    }
    return parent.st_dev != st.st_dev || parent.st_ino == st.st_ino;
}

UsageError diskmv_validate_disk(const std::string& input,
                                const Config& cfg,
                                const VolumeLookup& lookup,
                                Volume& out,
                                std::string& err) {
    std::string id = diskmv_bare_disk_id(input, cfg);

    if (id.empty() || !lookup.accepts(id)) {
        err = "'" + input + "' is not a valid disk name";
        return UsageError::InvalidDisk;
    }

    std::string mp = lookup.mount_point(id);
    struct stat st{};
    if (stat(mp.c_str(), &st) != 0) {
        err = "disk '" + id + "' not found at " + mp + ": " + strerror(errno);
        return UsageError::InvalidDisk;
    }

    if (!S_ISDIR(st.st_mode)) {
        err = "disk '" + id + "' mount point " + mp + " is not a directory";
        return UsageError::InvalidDisk;
    }

    if (cfg.require_mountpoint && !diskmv_is_mountpoint(mp, st)) {
        err = "disk '" + id + "' is not mounted at " + mp;
        return UsageError::InvalidDisk;
    }

    out.id = id;
    out.mount_point = mp;
    DISKMV_LOG_DEBUG("volume", "Disk '%s' resolved to %s", id.c_str(), mp.c_str());
    return UsageError::None;
}

UsageError diskmv_validate_disk_pair(const std::string& src_input,
                                     const std::string& dst_input,
                                     const Config& cfg,
                                     const VolumeLookup& lookup,
                                     Volume& src,
                                     Volume& dst,
                                     std::string& err) {
    UsageError rc = diskmv_validate_disk(src_input, cfg, lookup, src, err);
    if (rc != UsageError::None) return rc;

    rc = diskmv_validate_disk(dst_input, cfg, lookup, dst, err);
    if (rc != UsageError::None) return rc;

    if (src.id == dst.id) {
        err = "source and destination are the same disk (" + src.id + ")";
        return UsageError::SameDisk;
    }

    return UsageError::None;
}
