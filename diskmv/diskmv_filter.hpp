#pragma once

#include "diskmv_busy.hpp"
#include "diskmv_types.hpp"

#include <cstdint>
#include <memory>
#include <set>
#include <string>
#include <vector>

// -----------------------------------------------------------------------------
// Filter gates
// -----------------------------------------------------------------------------
//
// Each gate either lets the entry through (returns true) or fills in the
// verdict that stops it. Gates run in a fixed order and the first rejection
// wins.
class FilterGate {
public:
    virtual ~FilterGate() = default;
    virtual const char* name() const noexcept = 0;
    virtual bool admits(const CandidateEntry& entry, Verdict& verdict) const = 0;
};

// Regular files always; symlinks when copied as links; directories once empty.
class TypeGate : public FilterGate {
public:
    explicit TypeGate(bool copy_symlinks) noexcept : copy_symlinks_(copy_symlinks) {}
    const char* name() const noexcept override { return "type"; }
    bool admits(const CandidateEntry& entry, Verdict& verdict) const override;

private:
    bool copy_symlinks_;
};

// Inclusive size ceiling for regular files.
class SizeGate : public FilterGate {
public:
    explicit SizeGate(uint64_t max_bytes) noexcept : max_bytes_(max_bytes) {}
    const char* name() const noexcept override { return "size"; }
    bool admits(const CandidateEntry& entry, Verdict& verdict) const override;

private:
    uint64_t max_bytes_;
};

class ExtensionGate : public FilterGate {
public:
    explicit ExtensionGate(std::set<std::string> extensions) : extensions_(std::move(extensions)) {}
    const char* name() const noexcept override { return "extension"; }
    bool admits(const CandidateEntry& entry, Verdict& verdict) const override;

private:
    std::set<std::string> extensions_;
};

class BusyGate : public FilterGate {
public:
    explicit BusyGate(BusyProbe& probe) noexcept : probe_(probe) {}
    const char* name() const noexcept override { return "busy"; }
    bool admits(const CandidateEntry& entry, Verdict& verdict) const override;

private:
    BusyProbe& probe_;
};

// An existing destination directory is a merge target, never a duplicate.
class DuplicateGate : public FilterGate {
public:
    const char* name() const noexcept override { return "duplicate"; }
    bool admits(const CandidateEntry& entry, Verdict& verdict) const override;
};

// -----------------------------------------------------------------------------
// Compiled predicate set
// -----------------------------------------------------------------------------
class FilterSet {
public:
    // Builds the gate list the policy asks for. The probe must outlive the set.
    static FilterSet compile(const MovePolicy& policy, BusyProbe& probe);

    Verdict evaluate(const CandidateEntry& entry) const;

    std::vector<std::string> gate_names() const;

private:
    std::vector<std::unique_ptr<FilterGate>> gates_;
};

// Lower-case extension of the last path segment, without the dot. Empty for
// names without one (".bashrc" has none).
std::string diskmv_file_extension(const std::string& path);
