#include "diskmv_busy.hpp"
#include "diskmv_io.hpp"
#include "test_util.hpp"

#include <cassert>
#include <iostream>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

// Child keeps `path` open (or only mapped) until the parent writes to `release`.
static pid_t spawn_holder(const std::string& path, bool map_only, int& release_fd) {
    int ready[2];
    int release[2];
    int rc = pipe(ready);
    assert(rc == 0);
    rc = pipe(release);
    assert(rc == 0);
    (void)rc;

    pid_t pid = fork();
    assert(pid >= 0);
    if (pid == 0) {
        close(ready[0]);
        close(release[1]);
        int fd = open(path.c_str(), O_RDONLY);
        if (fd < 0) _exit(1);
        if (map_only) {
            void* p = mmap(nullptr, 1, PROT_READ, MAP_PRIVATE, fd, 0);
            if (p == MAP_FAILED) _exit(1);
            close(fd);
        }
        char c = 'r';
        if (write(ready[1], &c, 1) != 1) _exit(1);
        if (read(release[0], &c, 1) < 0) _exit(1);
        _exit(0);
    }

    close(ready[1]);
    close(release[0]);
    char c = 0;
    ssize_t n = read(ready[0], &c, 1);
    assert(n == 1);
    (void)n;
    close(ready[0]);
    release_fd = release[1];
    return pid;
}

static void reap(pid_t pid, int release_fd) {
    char c = 'x';
    ssize_t n = write(release_fd, &c, 1);
    (void)n;
    close(release_fd);
    int status = 0;
    waitpid(pid, &status, 0);
    assert(WIFEXITED(status) && WEXITSTATUS(status) == 0);
}

int main() {
    ScratchRoot scratch;
    std::string path = scratch.path("disk2/open.mkv");
    std::string idle = scratch.path("disk2/idle.mkv");
    test_write_file(path, "held open by a child");
    test_write_file(idle, "nobody looks at this");

    struct stat st{};
    struct stat idle_st{};
    int rc = stat(path.c_str(), &st);
    assert(rc == 0);
    rc = stat(idle.c_str(), &idle_st);
    assert(rc == 0);
    (void)rc;

    ProcFdBusyProbe probe;

    assert(!probe.is_open_elsewhere(path, st));

    // Our own descriptors do not count.
    {
        unique_fd self(open(path.c_str(), O_RDONLY));
        assert(self);
        assert(!probe.is_open_elsewhere(path, st));
    }

    int release_fd = -1;
    pid_t child = spawn_holder(path, false, release_fd);
    assert(probe.is_open_elsewhere(path, st));
    assert(!probe.is_open_elsewhere(idle, idle_st));
    reap(child, release_fd);
    assert(!probe.is_open_elsewhere(path, st));

    // A mapping without an open descriptor still counts.
    child = spawn_holder(path, true, release_fd);
    assert(probe.is_open_elsewhere(path, st));
    reap(child, release_fd);

    // Missing procfs: nothing is reported busy.
    ProcFdBusyProbe nowhere(scratch.path("no-proc"));
    assert(!nowhere.is_open_elsewhere(path, st));

    std::cout << "Busy probe test passed!" << std::endl;
    return 0;
}
