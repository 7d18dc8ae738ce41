#include "diskmv_filter.hpp"
#include "diskmv_log.hpp"

#include <cctype>
#include <cinttypes>
#include <cstdio>

std::string diskmv_file_extension(const std::string& path) {
    size_t slash = path.rfind('/');
    std::string base = (slash == std::string::npos) ? path : path.substr(slash + 1);

    size_t dot = base.rfind('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 == base.size()) {
        return std::string();
    }

    std::string ext = base.substr(dot + 1);
    for (auto& c : ext) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return ext;
}

bool TypeGate::admits(const CandidateEntry& entry, Verdict& verdict) const {
    switch (entry.type) {
    case EntryType::Regular:
        return true;
    case EntryType::Symlink:
        if (copy_symlinks_) return true;
        verdict = {Eligibility::SkipFiltered, "symlink (use -l to move links)"};
        return false;
    case EntryType::Directory:
        if (entry.dir_empty) return true;
        verdict = {Eligibility::SkipFiltered, "directory not empty"};
        return false;
    case EntryType::Other:
        break;
    }
    verdict = {Eligibility::SkipFiltered, "not a file, directory or symlink"};
    return false;
}

bool SizeGate::admits(const CandidateEntry& entry, Verdict& verdict) const {
    if (entry.type != EntryType::Regular) return true;
    if (entry.size() <= max_bytes_) return true;

    char reason[96];
    snprintf(reason, sizeof(reason), "larger than %" PRIu64 " KB", max_bytes_ / 1024);
    verdict = {Eligibility::SkipFiltered, reason};
    return false;
}

bool ExtensionGate::admits(const CandidateEntry& entry, Verdict& verdict) const {
    if (entry.type != EntryType::Regular) return true;
    if (extensions_.count(diskmv_file_extension(entry.rel_path)) != 0) return true;

    verdict = {Eligibility::SkipFiltered, "extension not selected"};
    return false;
}

bool BusyGate::admits(const CandidateEntry& entry, Verdict& verdict) const {
    if (entry.type != EntryType::Regular) return true;
    if (!probe_.is_open_elsewhere(entry.src_path, entry.src_st)) return true;

    verdict = {Eligibility::SkipBusy, "in use by another process"};
    return false;
}

bool DuplicateGate::admits(const CandidateEntry& entry, Verdict& verdict) const {
    if (!entry.dst_exists || S_ISDIR(entry.dst_st.st_mode)) return true;

    verdict = {Eligibility::SkipDuplicate, "overwrite denied, already exists on destination (use -c)"};
    return false;
}

FilterSet FilterSet::compile(const MovePolicy& policy, BusyProbe& probe) {
    FilterSet set;
    set.gates_.push_back(std::make_unique<TypeGate>(policy.copy_symlinks));
    if (policy.max_size_bytes) {
        set.gates_.push_back(std::make_unique<SizeGate>(*policy.max_size_bytes));
    }
    if (policy.allowed_extensions) {
        set.gates_.push_back(std::make_unique<ExtensionGate>(*policy.allowed_extensions));
    }
    set.gates_.push_back(std::make_unique<BusyGate>(probe));
    if (!policy.clobber) {
        set.gates_.push_back(std::make_unique<DuplicateGate>());
    }
    return set;
}

Verdict FilterSet::evaluate(const CandidateEntry& entry) const {
    Verdict verdict;
    for (const auto& gate : gates_) {
        if (!gate->admits(entry, verdict)) {
            DISKMV_LOG_DEBUG("filter", "%s: rejected by %s gate (%s)",
                             entry.rel_path.c_str(), gate->name(), verdict.reason.c_str());
            return verdict;
        }
    }
    return Verdict{};
}

std::vector<std::string> FilterSet::gate_names() const {
    std::vector<std::string> names;
    for (const auto& gate : gates_) {
        names.emplace_back(gate->name());
    }
    return names;
}
