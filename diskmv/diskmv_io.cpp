#include "diskmv_io.hpp"
#include "diskmv_log.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <thread>

#include <fcntl.h>

// -----------------------------------------------------------------------------
// Reliable I/O with retries
// -----------------------------------------------------------------------------
ssize_t diskmv_safe_read(int fd, void* buf, size_t count) noexcept {
    ssize_t total = 0;

    while (total < static_cast<ssize_t>(count)) {
        ssize_t res = read(fd, static_cast<char*>(buf) + total, count - total);

        if (res > 0) {
            total += res;
        } else if (res == 0) {
            break;
        } else {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                std::this_thread::sleep_for(std::chrono::microseconds(100));
                continue;
            }
            return -1;
        }
    }

    return total;
}

ssize_t diskmv_safe_write(int fd, const void* buf, size_t count) noexcept {
    ssize_t total = 0;

    while (total < static_cast<ssize_t>(count)) {
        ssize_t res = write(fd, static_cast<const char*>(buf) + total, count - total);

        if (res > 0) {
            total += res;
        } else if (res < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                std::this_thread::sleep_for(std::chrono::microseconds(100));
                continue;
            }
            return -1;
        } else {
            errno = EIO;
            return -1;
        }
    }

    return total;
}

// -----------------------------------------------------------------------------
// Directory helpers
// -----------------------------------------------------------------------------
bool diskmv_list_dir(const std::string& path, std::vector<std::string>& names) noexcept {
    names.clear();

    unique_dir dir(opendir(path.c_str()));
    if (!dir) {
        return false;
    }

    try {
        errno = 0;
        struct dirent* de;
        while ((de = readdir(dir.get())) != nullptr) {
            if (strcmp(de->d_name, ".") == 0 || strcmp(de->d_name, "..") == 0) continue;
            names.emplace_back(de->d_name);
        }
        if (errno != 0) {
            return false;
        }
        std::sort(names.begin(), names.end());
    } catch (const std::bad_alloc&) {
        errno = ENOMEM;
        return false;
    }

    return true;
}

bool diskmv_dir_is_empty(const std::string& path) noexcept {
    unique_dir dir(opendir(path.c_str()));
    if (!dir) {
        return false;
    }

    struct dirent* de;
    while ((de = readdir(dir.get())) != nullptr) {
        if (strcmp(de->d_name, ".") == 0 || strcmp(de->d_name, "..") == 0) continue;
        return false;
    }
    return true;
}

int diskmv_fsync_dir(const std::string& path) noexcept {
    unique_fd fd(open(path.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC));
    if (!fd) {
        if (errno != ENOENT && errno != EACCES) {
            DISKMV_LOG_WARN("io", "open directory failed for fsync %s: %s", path.c_str(), strerror(errno));
        }
        return -1;
    }

    if (fsync(fd.get()) != 0) {
        DISKMV_LOG_WARN("io", "fsync directory failed %s: %s", path.c_str(), strerror(errno));
        return -1;
    }

    return 0;
}

// -----------------------------------------------------------------------------
// Path string helpers (no filesystem access)
// -----------------------------------------------------------------------------
std::string diskmv_join_path(const std::string& base, const std::string& rel) {
    if (rel.empty()) return base;
    if (base.empty()) return rel;
    if (base.back() == '/') return base + rel;
    return base + "/" + rel;
}

std::string diskmv_parent_path(const std::string& path) {
    size_t pos = path.rfind('/');
    if (pos == std::string::npos) return std::string();
    if (pos == 0) return "/";
    return path.substr(0, pos);
}
