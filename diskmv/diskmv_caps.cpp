#include "diskmv_caps.hpp"
#include "diskmv_log.hpp"

#include <cerrno>
#include <cstring>

#include <sys/capability.h>
#include <sys/prctl.h>

static bool diskmv_cap_effective(cap_t caps, cap_value_t cap) noexcept {
    cap_flag_value_t value = CAP_CLEAR;
    if (cap_get_flag(caps, cap, CAP_EFFECTIVE, &value) != 0) {
        return false;
    }
    return value == CAP_SET;
}

CapabilityReport diskmv_probe_capabilities() noexcept {
    CapabilityReport report;

    cap_t caps = cap_get_proc();
    if (!caps) {
        DISKMV_LOG_WARN("caps", "cap_get_proc failed: %s", strerror(errno));
        return report;
    }

    report.can_chown = diskmv_cap_effective(caps, CAP_CHOWN);
    report.can_fowner = diskmv_cap_effective(caps, CAP_FOWNER);
    report.can_read_all = diskmv_cap_effective(caps, CAP_DAC_READ_SEARCH);
    report.can_trace = diskmv_cap_effective(caps, CAP_SYS_PTRACE);

    cap_free(caps);
    return report;
}

int diskmv_warn_missing_capabilities(const CapabilityReport& report) noexcept {
    int missing = 0;

    if (!report.can_chown) {
        DISKMV_LOG_WARN("caps", "No CAP_CHOWN: files owned by other users will fail to copy");
        ++missing;
    }
    if (!report.can_fowner) {
        DISKMV_LOG_WARN("caps", "No CAP_FOWNER: metadata of files owned by other users cannot be preserved");
        ++missing;
    }
    if (!report.can_read_all) {
        DISKMV_LOG_WARN("caps", "No CAP_DAC_READ_SEARCH: unreadable files will fail to copy");
        ++missing;
    }
    if (!report.can_trace) {
        DISKMV_LOG_WARN("caps", "No CAP_SYS_PTRACE: files held open by other users may go undetected");
        ++missing;
    }

    return missing;
}

bool diskmv_drop_capabilities() noexcept {
    cap_t caps = cap_get_proc();
    if (!caps) return false;

    cap_value_t cap_list[] = {
        CAP_NET_ADMIN,
        CAP_NET_RAW,
        CAP_NET_BIND_SERVICE,
        CAP_SYS_RAWIO,
        CAP_SYS_MODULE,
        CAP_SYS_BOOT,
        CAP_SYS_TIME,
        CAP_MKNOD
    };
    const int ncaps = sizeof(cap_list) / sizeof(cap_list[0]);

    if (cap_set_flag(caps, CAP_EFFECTIVE, ncaps, cap_list, CAP_CLEAR) != 0 ||
        cap_set_flag(caps, CAP_PERMITTED, ncaps, cap_list, CAP_CLEAR) != 0 ||
        cap_set_flag(caps, CAP_INHERITABLE, ncaps, cap_list, CAP_CLEAR) != 0) {
        cap_free(caps);
        return false;
    }

    if (cap_set_proc(caps) != 0) {
        DISKMV_LOG_WARN("caps", "cap_set_proc failed: %s", strerror(errno));
        cap_free(caps);
        return false;
    }

    cap_free(caps);

    if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0) {
        DISKMV_LOG_WARN("caps", "PR_SET_NO_NEW_PRIVS failed: %s", strerror(errno));
        return false;
    }

    DISKMV_LOG_DEBUG("caps", "Dropped unneeded capabilities");
    return true;
}
