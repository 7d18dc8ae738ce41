#pragma once

// -----------------------------------------------------------------------------
// Security: capability probe and privilege dropping
// -----------------------------------------------------------------------------
struct CapabilityReport {
    bool can_chown = false;     // CAP_CHOWN: give copies their original owner
    bool can_fowner = false;    // CAP_FOWNER: set times and modes on foreign files
    bool can_read_all = false;  // CAP_DAC_READ_SEARCH
    bool can_trace = false;     // CAP_SYS_PTRACE: see every process's open files
};

CapabilityReport diskmv_probe_capabilities() noexcept;

// Logs one warning per capability a forced run will miss. Returns the number
// of missing capabilities.
int diskmv_warn_missing_capabilities(const CapabilityReport& report) noexcept;

// Clears capabilities the tool never uses from every set and forbids regaining
// privileges through exec.
bool diskmv_drop_capabilities() noexcept;
