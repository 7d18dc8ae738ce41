// -----------------------------------------------------------------------------
// diskmv: move a share path between array disks
// Copy first, delete the source only after the copy succeeded
// Single invocation tool, runs once over a tree and exits
// -----------------------------------------------------------------------------
#include "diskmv_busy.hpp"
#include "diskmv_caps.hpp"
#include "diskmv_cli.hpp"
#include "diskmv_config.hpp"
#include "diskmv_copy.hpp"
#include "diskmv_filter.hpp"
#include "diskmv_log.hpp"
#include "diskmv_mover.hpp"
#include "diskmv_path.hpp"
#include "diskmv_remove.hpp"
#include "diskmv_report.hpp"
#include "diskmv_volume.hpp"

#include <atomic>
#include <csignal>
#include <cstdio>
#include <string>

#include <unistd.h>

static constexpr int DISKMV_EXIT_INTERRUPTED = 130;

// -----------------------------------------------------------------------------
// Signal handling: stop before the next entry, second signal terminates
// -----------------------------------------------------------------------------
static std::atomic<bool> diskmv_stop{false};

static void diskmv_safe_signal_handler(int sig, siginfo_t* info, void* context) noexcept {
    (void)info;
    (void)context;

    bool already_stopping = diskmv_stop.exchange(true, std::memory_order_acq_rel);
    if (already_stopping) {
        signal(sig, SIG_DFL);
        raise(sig);
    }
}

static void diskmv_install_signal_handlers() noexcept {
    struct sigaction sa{};
    sa.sa_sigaction = diskmv_safe_signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_SIGINFO | SA_RESTART;

    sigaction(SIGTERM, &sa, nullptr);
    sigaction(SIGINT, &sa, nullptr);

    signal(SIGPIPE, SIG_IGN);
}

static int diskmv_usage_failure(const char* argv0, const std::string& msg) {
    fprintf(stderr, "diskmv: %s\n", msg.c_str());
    diskmv_print_usage(stderr, argv0);
    return 1;
}

// -----------------------------------------------------------------------------
// Entry point
// -----------------------------------------------------------------------------
int main(int argc, char* argv[]) {
    CliArgs args;
    std::string err;

    if (diskmv_parse_args(argc, argv, args, err) != UsageError::None) {
        return diskmv_usage_failure(argv[0], err);
    }
    if (args.help) {
        diskmv_print_help(stdout, argv[0]);
        return 0;
    }

    diskmv_log_set_stderr_level(diskmv_log_level_for_verbosity(args.policy.verbosity));

    auto cfg = diskmv_load_config_from_env();
    if (!cfg) {
        return diskmv_usage_failure(argv[0], "invalid DISKMV_* configuration");
    }

    diskmv_log_open(cfg->use_syslog);

    MountRootVolumeLookup lookup(*cfg);
    Volume src, dst;
    UsageError uerr = diskmv_validate_disk_pair(args.src_disk, args.dst_disk, *cfg, lookup, src, dst, err);
    if (uerr != UsageError::None) {
        DISKMV_LOG_DEBUG("diskmv", "Rejected disks (%s): %s", diskmv_usage_error_name(uerr), err.c_str());
        diskmv_log_close();
        return diskmv_usage_failure(argv[0], err);
    }

    std::string share_path;
    uerr = diskmv_resolve_share_path(args.path, *cfg, lookup, share_path, err);
    if (uerr != UsageError::None) {
        DISKMV_LOG_DEBUG("diskmv", "Rejected path (%s): %s", diskmv_usage_error_name(uerr), err.c_str());
        diskmv_log_close();
        return diskmv_usage_failure(argv[0], err);
    }

    diskmv_install_signal_handlers();

    if (!args.policy.dry_run) {
        diskmv_warn_missing_capabilities(diskmv_probe_capabilities());
    }
    if (!diskmv_drop_capabilities()) {
        DISKMV_LOG_DEBUG("diskmv", "Capabilities left unchanged");
    }

    ProcFdBusyProbe probe(cfg->proc_root);
    FilterSet filters = FilterSet::compile(args.policy, probe);
    PosixObjectCopier copier(*cfg);
    PosixObjectRemover remover(*cfg);
    RunReporter reporter(stdout, args.policy);

    ShareMover mover(args.policy, filters, copier, remover, reporter, diskmv_stop);
    RunSummary summary = mover.run(share_path, src, dst);

    diskmv_log_close();
    return summary.interrupted ? DISKMV_EXIT_INTERRUPTED : 0;
}
