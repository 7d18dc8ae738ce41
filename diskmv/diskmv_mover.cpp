#include "diskmv_mover.hpp"
#include "diskmv_config.hpp"
#include "diskmv_io.hpp"
#include "diskmv_log.hpp"

#include <cerrno>
#include <cinttypes>
#include <cstring>
#include <vector>

#include <sys/stat.h>

RunSummary ShareMover::run(const std::string& share_path, const Volume& src, const Volume& dst) {
    RunSummary summary;

    reporter_.begin(share_path, src, dst);
    DISKMV_LOG_INFO("mover", "%s run: %s from %s to %s",
                    policy_.dry_run ? "Dry" : "Forced",
                    share_path.c_str(), src.id.c_str(), dst.id.c_str());

    struct stat st{};
    std::string root = diskmv_join_path(src.mount_point, share_path);
    if (lstat(root.c_str(), &st) != 0) {
        if (errno == ENOENT) {
            DISKMV_LOG_WARN("mover", "%s is not present on %s, nothing to do",
                            share_path.c_str(), src.id.c_str());
        } else {
            CandidateEntry entry;
            entry.rel_path = share_path;
            entry.src_path = root;
            entry.dst_path = diskmv_join_path(dst.mount_point, share_path);
            fail(entry, std::string("cannot examine source: ") + strerror(errno), summary);
        }
    } else {
        visit(share_path, src, dst, 0, summary);
    }

    DISKMV_LOG_INFO("mover", "Run %s: moved=%" PRIu64 " would_move=%" PRIu64 " duplicate=%" PRIu64
                    " busy=%" PRIu64 " filtered=%" PRIu64 " failed=%" PRIu64 " bytes=%" PRIu64,
                    summary.interrupted ? "interrupted" : "finished",
                    summary.moved, summary.would_move, summary.skipped_duplicate,
                    summary.skipped_busy, summary.skipped_filtered, summary.failed, summary.bytes);
    reporter_.finish(summary);
    return summary;
}

bool ShareMover::visit(const std::string& rel, const Volume& src, const Volume& dst,
                       size_t depth, RunSummary& summary) {
    if (stop_.load(std::memory_order_acquire)) {
        summary.interrupted = true;
        return false;
    }

    CandidateEntry entry;
    entry.rel_path = rel;
    entry.src_path = diskmv_join_path(src.mount_point, rel);
    entry.dst_path = diskmv_join_path(dst.mount_point, rel);

    if (lstat(entry.src_path.c_str(), &entry.src_st) != 0) {
        if (errno == ENOENT) {
            DISKMV_LOG_DEBUG("mover", "%s vanished before it was examined", rel.c_str());
            return true;
        }
        fail(entry, std::string("cannot examine source: ") + strerror(errno), summary);
        return false;
    }
    entry.type = diskmv_entry_type(entry.src_st.st_mode);

    if (entry.type == EntryType::Directory) {
        if (depth >= constants::MAX_DIRECTORY_DEPTH) {
            fail(entry, "directory nesting too deep", summary);
            return false;
        }

        std::vector<std::string> names;
        if (!diskmv_list_dir(entry.src_path, names)) {
            fail(entry, std::string("cannot read directory: ") + strerror(errno), summary);
            return false;
        }

        bool all_gone = true;
        for (const auto& name : names) {
            if (!visit(diskmv_join_path(rel, name), src, dst, depth + 1, summary)) {
                all_gone = false;
            }
            if (summary.interrupted) return false;
        }

        entry.dir_empty = policy_.dry_run ? all_gone : diskmv_dir_is_empty(entry.src_path);
    }

    entry.dst_exists = lstat(entry.dst_path.c_str(), &entry.dst_st) == 0;

    MoveOutcome outcome = process(entry, src, dst, summary);
    DISKMV_LOG_DEBUG("mover", "%s: %s", rel.c_str(), diskmv_outcome_name(outcome));

    return !policy_.keep_source &&
           (outcome == MoveOutcome::Moved || outcome == MoveOutcome::DryRunWouldMove);
}

MoveOutcome ShareMover::process(const CandidateEntry& entry, const Volume& src, const Volume& dst,
                                RunSummary& summary) {
    Verdict verdict = filters_.evaluate(entry);
    const char* rel = entry.rel_path.c_str();

    switch (verdict.eligibility) {
    case Eligibility::SkipBusy:
        DISKMV_LOG_INFO("mover", "Skipped %s: %s", rel, verdict.reason.c_str());
        summary.count(MoveOutcome::SkippedBusy);
        reporter_.entry(entry, MoveOutcome::SkippedBusy, verdict.reason);
        return MoveOutcome::SkippedBusy;
    case Eligibility::SkipDuplicate:
        DISKMV_LOG_INFO("mover", "Skipped %s: %s", rel, verdict.reason.c_str());
        summary.count(MoveOutcome::SkippedDuplicate);
        reporter_.entry(entry, MoveOutcome::SkippedDuplicate, verdict.reason);
        return MoveOutcome::SkippedDuplicate;
    case Eligibility::SkipFiltered:
        summary.count(MoveOutcome::SkippedFiltered);
        reporter_.entry(entry, MoveOutcome::SkippedFiltered, verdict.reason);
        return MoveOutcome::SkippedFiltered;
    case Eligibility::Eligible:
        break;
    }

    std::string err;
    if (!copier_.precheck(entry, dst, err)) {
        fail(entry, err, summary);
        return MoveOutcome::Failed;
    }

    if (policy_.dry_run) {
        summary.count(MoveOutcome::DryRunWouldMove);
        summary.bytes += entry.size();
        reporter_.entry(entry, MoveOutcome::DryRunWouldMove, std::string());
        return MoveOutcome::DryRunWouldMove;
    }

    if (!copier_.copy(entry, src, dst, err)) {
        fail(entry, err, summary);
        return MoveOutcome::Failed;
    }

    if (!policy_.keep_source && !remover_.remove(entry, err)) {
        fail(entry, "copied but source not removed: " + err, summary);
        return MoveOutcome::Failed;
    }

    DISKMV_LOG_INFO("mover", "%s %s %s (%" PRIu64 " bytes) from %s to %s",
                    policy_.keep_source ? "Copied" : "Moved",
                    diskmv_entry_type_name(entry.type), rel, entry.size(),
                    src.id.c_str(), dst.id.c_str());
    summary.count(MoveOutcome::Moved);
    summary.bytes += entry.size();
    reporter_.entry(entry, MoveOutcome::Moved, std::string());
    return MoveOutcome::Moved;
}

void ShareMover::fail(const CandidateEntry& entry, const std::string& err, RunSummary& summary) {
    DISKMV_LOG_INFO("mover", "Failed %s: %s", entry.rel_path.c_str(), err.c_str());
    summary.count(MoveOutcome::Failed);
    reporter_.entry(entry, MoveOutcome::Failed, err);
}
