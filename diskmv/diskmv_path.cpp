#include "diskmv_path.hpp"
#include "diskmv_io.hpp"
#include "diskmv_log.hpp"

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>

#include <sys/stat.h>

#ifndef PATH_MAX
#define PATH_MAX 4096
#endif

bool diskmv_normalize_share_path(const std::string& raw, std::string& out) {
    std::string result;
    size_t start = 0;

    while (start <= raw.size()) {
        size_t end = raw.find('/', start);
        if (end == std::string::npos) end = raw.size();
        std::string seg = raw.substr(start, end - start);
        start = end + 1;

        if (seg.empty() || seg == ".") continue;
        if (seg == "..") return false;

        if (!result.empty()) result += '/';
        result += seg;
    }

    out = result;
    return true;
}

bool diskmv_share_path_exists(const std::string& rel,
                              const Config& cfg,
                              const VolumeLookup& lookup) noexcept {
    struct stat st{};
    std::string in_share = diskmv_join_path(cfg.share_root_path(), rel);
    if (lstat(in_share.c_str(), &st) == 0) {
        return true;
    }

    for (const auto& id : lookup.known_volumes()) {
        std::string on_disk = diskmv_join_path(lookup.mount_point(id), rel);
        if (lstat(on_disk.c_str(), &st) == 0) {
            DISKMV_LOG_DEBUG("path", "'%s' found on %s", rel.c_str(), id.c_str());
            return true;
        }
    }
    return false;
}

// Strips "<mnt_root>/<volume or share>/" from a resolved absolute path. Returns
// false when the path does not live below the mount root.
static bool diskmv_strip_mount_prefix(const std::string& resolved,
                                      const Config& cfg,
                                      std::string& rel) {
    const std::string root_prefix = cfg.mnt_root + "/";
    if (resolved.compare(0, root_prefix.size(), root_prefix) != 0) {
        return false;
    }

    std::string rest = resolved.substr(root_prefix.size());
    size_t slash = rest.find('/');
    rel = (slash == std::string::npos) ? std::string() : rest.substr(slash + 1);
    return true;
}

UsageError diskmv_resolve_share_path(const std::string& input,
                                     const Config& cfg,
                                     const VolumeLookup& lookup,
                                     std::string& out,
                                     std::string& err) {
    if (input.empty()) {
        err = "empty path";
        return UsageError::InvalidPath;
    }

    std::string candidate = input;

    struct stat st{};
    if (lstat(input.c_str(), &st) == 0) {
        char resolved[PATH_MAX];
        if (realpath(input.c_str(), resolved) != nullptr) {
            std::string rel;
            if (diskmv_strip_mount_prefix(resolved, cfg, rel)) {
                candidate = rel;
            } else {
                DISKMV_LOG_DEBUG("path", "'%s' resolves outside %s, treating it as share-relative",
                                 input.c_str(), cfg.mnt_root.c_str());
            }
        } else {
            DISKMV_LOG_DEBUG("path", "realpath failed for %s: %s", input.c_str(), strerror(errno));
        }
    }

    std::string rel;
    if (!diskmv_normalize_share_path(candidate, rel)) {
        err = "'" + input + "' must not contain '..'";
        return UsageError::InvalidPath;
    }

    if (rel.empty()) {
        err = "'" + input + "' does not name anything inside a share";
        return UsageError::InvalidPath;
    }

    if (!diskmv_share_path_exists(rel, cfg, lookup)) {
        err = "'" + rel + "' does not exist in " + cfg.share_root_path();
        return UsageError::InvalidPath;
    }

    out = rel;
    DISKMV_LOG_DEBUG("path", "Share path '%s' resolved from '%s'", rel.c_str(), input.c_str());
    return UsageError::None;
}
