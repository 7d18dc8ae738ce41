#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include <dirent.h>
#include <sys/types.h>
#include <unistd.h>

// -----------------------------------------------------------------------------
// RAII wrapper for file descriptors
// -----------------------------------------------------------------------------
class unique_fd {
    int fd_ = -1;
public:
    explicit unique_fd(int fd = -1) noexcept : fd_(fd) {}
    ~unique_fd() { if (fd_ >= 0) ::close(fd_); }

    unique_fd(const unique_fd&) = delete;
    unique_fd& operator=(const unique_fd&) = delete;

    unique_fd(unique_fd&& o) noexcept : fd_(o.fd_) { o.fd_ = -1; }
    unique_fd& operator=(unique_fd&& o) noexcept {
        if (this != &o) {
            if (fd_ >= 0) ::close(fd_);
            fd_ = o.fd_;
            o.fd_ = -1;
        }
        return *this;
    }

    void reset(int fd = -1) noexcept {
        if (fd_ >= 0) ::close(fd_);
        fd_ = fd;
    }

    int get() const noexcept { return fd_; }
    explicit operator bool() const noexcept { return fd_ >= 0; }
};

// Directory stream counterpart of unique_fd.
class unique_dir {
    DIR* dir_ = nullptr;
public:
    explicit unique_dir(DIR* dir = nullptr) noexcept : dir_(dir) {}
    ~unique_dir() { if (dir_) ::closedir(dir_); }

    unique_dir(const unique_dir&) = delete;
    unique_dir& operator=(const unique_dir&) = delete;

    DIR* get() const noexcept { return dir_; }
    explicit operator bool() const noexcept { return dir_ != nullptr; }
};

ssize_t diskmv_safe_read(int fd, void* buf, size_t count) noexcept;
ssize_t diskmv_safe_write(int fd, const void* buf, size_t count) noexcept;

// Names in a directory, excluding "." and "..", sorted. Returns false and sets
// errno when the directory cannot be read.
bool diskmv_list_dir(const std::string& path, std::vector<std::string>& names) noexcept;

// True when the directory holds no entry at all (hidden ones included).
bool diskmv_dir_is_empty(const std::string& path) noexcept;

int diskmv_fsync_dir(const std::string& path) noexcept;

std::string diskmv_join_path(const std::string& base, const std::string& rel);
std::string diskmv_parent_path(const std::string& path);
