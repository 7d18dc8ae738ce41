#include "diskmv_remove.hpp"
#include "test_util.hpp"

#include <cassert>
#include <iostream>

#include <sys/stat.h>
#include <unistd.h>

static CandidateEntry entry_for(const ScratchRoot& scratch, const std::string& rel) {
    CandidateEntry e;
    e.rel_path = rel;
    e.src_path = scratch.path("disk2/" + rel);
    e.dst_path = scratch.path("disk5/" + rel);
    int rc = lstat(e.src_path.c_str(), &e.src_st);
    assert(rc == 0);
    (void)rc;
    e.type = diskmv_entry_type(e.src_st.st_mode);
    return e;
}

int main() {
    ScratchRoot scratch;
    Config cfg = scratch.config();
    PosixObjectRemover remover(cfg);
    std::string err;

    test_make_dirs(scratch.path("disk2/movies/Foo"));
    test_make_dirs(scratch.path("disk5/movies/Foo"));

    // Plain file.
    test_write_file(scratch.path("disk2/movies/Foo/Foo.mkv"), "video");
    CandidateEntry file = entry_for(scratch, "movies/Foo/Foo.mkv");
    assert(remover.remove(file, err));
    assert(!test_exists(file.src_path));

    // Already gone counts as removed.
    assert(remover.remove(file, err));

    // Content changed after the copy: left in place.
    test_write_file(scratch.path("disk2/movies/Foo/notes.txt"), "v1");
    CandidateEntry notes = entry_for(scratch, "movies/Foo/notes.txt");
    test_write_file(scratch.path("disk2/movies/Foo/notes.txt"), "version two");
    assert(!remover.remove(notes, err));
    assert(err.find("changed") != std::string::npos);
    assert(test_exists(notes.src_path));

    // Replaced by another file under the same name: left in place.
    CandidateEntry swapped = entry_for(scratch, "movies/Foo/notes.txt");
    unlink(swapped.src_path.c_str());
    test_write_file(scratch.path("disk2/movies/Foo/other"), "x");
    int rc = rename(scratch.path("disk2/movies/Foo/other").c_str(), swapped.src_path.c_str());
    assert(rc == 0);
    (void)rc;
    assert(!remover.remove(swapped, err));
    assert(test_exists(swapped.src_path));

    // Symlinks are unlinked, never followed.
    rc = symlink("notes.txt", scratch.path("disk2/movies/Foo/link").c_str());
    assert(rc == 0);
    CandidateEntry link = entry_for(scratch, "movies/Foo/link");
    assert(remover.remove(link, err));
    assert(!test_exists(link.src_path));
    assert(test_exists(scratch.path("disk2/movies/Foo/notes.txt")));

    // A directory that is not empty is never removed.
    CandidateEntry dir = entry_for(scratch, "movies/Foo");
    assert(!remover.remove(dir, err));
    assert(test_exists(dir.src_path));

    unlink(scratch.path("disk2/movies/Foo/notes.txt").c_str());
    assert(remover.remove(dir, err));
    assert(!test_exists(dir.src_path));

    std::cout << "Source remover test passed!" << std::endl;
    return 0;
}
