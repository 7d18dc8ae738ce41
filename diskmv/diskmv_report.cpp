#include "diskmv_report.hpp"

#include <cinttypes>

std::string diskmv_itemize_changes(const CandidateEntry& entry) {
    std::string code(11, '.');

    switch (entry.type) {
    case EntryType::Regular:   code[0] = '>'; code[1] = 'f'; break;
    case EntryType::Directory: code[0] = 'c'; code[1] = 'd'; break;
    case EntryType::Symlink:   code[0] = 'c'; code[1] = 'L'; break;
    case EntryType::Other:     code[0] = 'c'; code[1] = 'S'; break;
    }

    const struct stat& s = entry.src_st;
    const struct stat& d = entry.dst_st;

    // A missing destination, or one of another type, is created from scratch.
    if (!entry.dst_exists || diskmv_entry_type(d.st_mode) != entry.type) {
        code.replace(2, 9, "+++++++++");
        return code;
    }

    if (entry.type == EntryType::Directory) code[0] = '.';

    if (entry.type == EntryType::Regular && s.st_size != d.st_size) code[3] = 's';
    if (s.st_mtim.tv_sec != d.st_mtim.tv_sec || s.st_mtim.tv_nsec != d.st_mtim.tv_nsec) code[4] = 't';
    if (entry.type != EntryType::Symlink && (s.st_mode & 07777) != (d.st_mode & 07777)) code[5] = 'p';
    if (s.st_uid != d.st_uid) code[6] = 'o';
    if (s.st_gid != d.st_gid) code[7] = 'g';
    if (entry.type != EntryType::Directory &&
        (s.st_atim.tv_sec != d.st_atim.tv_sec || s.st_atim.tv_nsec != d.st_atim.tv_nsec)) {
        code[8] = 'u';
    }

    return code;
}

void RunReporter::begin(const std::string& share_path, const Volume& src, const Volume& dst) {
    if (policy_.dry_run) {
        fprintf(out_, "diskmv: dry run, nothing will be changed (use -f to move files)\n");
    }
    if (policy_.verbosity >= 1) {
        fprintf(out_, "%s %s from %s to %s\n",
                policy_.keep_source ? "copying" : "moving",
                share_path.c_str(), src.mount_point.c_str(), dst.mount_point.c_str());
    }
}

void RunReporter::entry(const CandidateEntry& entry, MoveOutcome outcome, const std::string& detail) {
    const char* rel = entry.rel_path.c_str();

    switch (outcome) {
    case MoveOutcome::Moved:
    case MoveOutcome::DryRunWouldMove: {
        if (policy_.verbosity >= 2) {
            fprintf(out_, "%s %s\n", diskmv_itemize_changes(entry).c_str(), rel);
        }
        if (policy_.verbosity < 1) return;
        const char* verb;
        if (outcome == MoveOutcome::Moved) {
            verb = policy_.keep_source ? "copied" : "moved";
        } else {
            verb = policy_.keep_source ? "would copy" : "would move";
        }
        fprintf(out_, "%s: %s\n", verb, rel);
        return;
    }
    case MoveOutcome::SkippedDuplicate:
    case MoveOutcome::SkippedBusy:
        if (policy_.verbosity >= 1) {
            fprintf(out_, "skipped: %s (%s)\n", rel, detail.c_str());
        }
        return;
    case MoveOutcome::SkippedFiltered:
        if (policy_.verbosity >= 1) {
            fprintf(out_, "filtered: %s (%s)\n", rel, detail.c_str());
        }
        return;
    case MoveOutcome::Failed:
        if (policy_.verbosity >= 1) {
            fprintf(out_, "failed: %s: %s\n", rel, detail.c_str());
        }
        return;
    }
}

void RunReporter::finish(const RunSummary& summary) {
    const char* state = summary.interrupted ? "interrupted" : "finished";

    if (policy_.dry_run) {
        fprintf(out_,
                "dry run %s: %" PRIu64 " would %s, %" PRIu64 " skipped duplicate, %" PRIu64
                " skipped busy, %" PRIu64 " filtered, %" PRIu64 " failed, %" PRIu64 " bytes\n",
                state, summary.would_move, policy_.keep_source ? "copy" : "move",
                summary.skipped_duplicate, summary.skipped_busy,
                summary.skipped_filtered, summary.failed, summary.bytes);
        fprintf(out_, "diskmv: dry run, no changes were made\n");
    } else {
        fprintf(out_,
                "forced run: %s %s: %" PRIu64 " %s, %" PRIu64 " skipped duplicate, %" PRIu64
                " skipped busy, %" PRIu64 " filtered, %" PRIu64 " failed, %" PRIu64 " bytes\n",
                policy_.keep_source ? "copy" : "move", state, summary.moved,
                policy_.keep_source ? "copied" : "moved",
                summary.skipped_duplicate, summary.skipped_busy,
                summary.skipped_filtered, summary.failed, summary.bytes);
    }
    fflush(out_);
}
