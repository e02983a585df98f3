#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <memory>
#include <string>
#include <unistd.h>
#include <vector>

#include "chunked.h"
#include "config.h"
#include "endpoint_factory.h"
#include "local_endpoint.h"
#include "log.h"
#include "planner.h"
#include "restore.h"
#include "subvolume.h"
#include "transaction_log.h"
#include "transfer.h"
#include "util.h"
#include "verify.h"

using namespace snapvault;

static const char *DEFAULT_CONFIG = "/etc/snapvault.yaml";
static const char *SNAPVAULT_VERSION = "0.1.0";

struct CliOptions {
    std::string config_path = DEFAULT_CONFIG;
    std::vector<std::string> volumes;
    bool verbose = false;
    bool quiet = false;
    bool force = false;
    bool show_version = false;
    std::string command;
    std::vector<std::string> args;
    int target_index = -1;
    std::string snapshot_name;
    std::string before;
    bool all = false;
    std::string to;
    bool no_incremental = false;
    bool dry_run = false;
    std::string level = "metadata";
    bool cleanup = false;
};

static void print_banner() {
    std::printf("snapvault %s\n", SNAPVAULT_VERSION);
}

static void print_usage() {
    std::printf("usage: snapvault [options] <command> [args]\n"
                "commands:\n"
                "  run                    snapshot, transfer to every target, prune\n"
                "  snapshot               take new snapshots\n"
                "  transfer               transfer snapshots to targets\n"
                "  prune                  apply retention at sources and targets\n"
                "  list                   list snapshots and locks\n"
                "  transfers [--cleanup]  list chunked transfers\n"
                "  resume <id>            resume a chunked transfer\n"
                "  unlock <volume> [id]   release transfer locks\n"
                "  restore <volume>       restore snapshots from a local backup\n"
                "  verify <volume>        verify a local backup\n"
                "options:\n"
                "  --config PATH, --volume PATH, -v/--verbose, -q/--quiet, --force, --version\n"
                "  --target N, --snapshot NAME, --before YYYYMMDD-HHMMSS, --all, --to DIR,\n"
                "  --no-incremental, --dry-run, --level metadata|stream\n");
}

static void format_time(char *buf, size_t len, time_t t) {
    struct tm tm;
    localtime_r(&t, &tm);
    std::strftime(buf, len, "%d-%m-%Y %H:%M", &tm);
}

static bool parse_args(int argc, char **argv, CliOptions *opts, std::string *err) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        auto value = [&](const char *what, std::string *out) {
            if (i + 1 >= argc) {
                *err = arg + " requires " + what;
                return false;
            }
            *out = argv[++i];
            return true;
        };
        std::string v;
        if (arg == "--config") {
            if (!value("a path", &opts->config_path)) return false;
        } else if (arg == "--volume") {
            if (!value("a path", &v)) return false;
            opts->volumes.push_back(v);
        } else if (arg == "--verbose" || arg == "-v") {
            opts->verbose = true;
        } else if (arg == "--quiet" || arg == "-q") {
            opts->quiet = true;
        } else if (arg == "--force") {
            opts->force = true;
        } else if (arg == "--version") {
            opts->show_version = true;
        } else if (arg == "--target") {
            if (!value("an index", &v)) return false;
            char *end = nullptr;
            long n = std::strtol(v.c_str(), &end, 10);
            if (v.empty() || *end != '\0' || n < 0) {
                *err = "invalid target index " + v;
                return false;
            }
            opts->target_index = static_cast<int>(n);
        } else if (arg == "--snapshot") {
            if (!value("a name", &opts->snapshot_name)) return false;
        } else if (arg == "--before") {
            if (!value("a timestamp", &opts->before)) return false;
        } else if (arg == "--all") {
            opts->all = true;
        } else if (arg == "--to") {
            if (!value("a directory", &opts->to)) return false;
        } else if (arg == "--no-incremental") {
            opts->no_incremental = true;
        } else if (arg == "--dry-run") {
            opts->dry_run = true;
        } else if (arg == "--level") {
            if (!value("metadata or stream", &opts->level)) return false;
        } else if (arg == "--cleanup") {
            opts->cleanup = true;
        } else if (!arg.empty() && arg[0] == '-') {
            *err = "unknown option " + arg;
            return false;
        } else if (opts->command.empty()) {
            opts->command = arg;
        } else {
            opts->args.push_back(arg);
        }
    }
    return true;
}

static std::vector<const VolumeConfig *> select_volumes(const Config &cfg, const CliOptions &opts) {
    std::vector<const VolumeConfig *> out;
    for (const auto &volume : cfg.volumes) {
        if (opts.volumes.empty()) {
            if (volume.enabled) out.push_back(&volume);
            continue;
        }
        for (const auto &name : opts.volumes) {
            if (absolute_path(name) == absolute_path(volume.path)) out.push_back(&volume);
        }
    }
    return out;
}

static const VolumeConfig *find_volume(const Config &cfg, const std::string &path) {
    for (const auto &volume : cfg.volumes) {
        if (absolute_path(path) == absolute_path(volume.path)) return &volume;
    }
    return nullptr;
}

class Session {
public:
    Session(const Config &cfg, const CliOptions &opts, Log &log)
        : cfg_(cfg), opts_(opts), log_(log), journal_(cfg.transaction_log, log) {}

    TransactionLog &journal() { return journal_; }

    std::unique_ptr<LocalEndpoint> source(const VolumeConfig &volume) {
        return std::make_unique<LocalEndpoint>(source_endpoint_config(cfg_, volume), log_);
    }

    std::unique_ptr<Endpoint> target(const VolumeConfig &volume, const TargetConfig &target, std::string *err) {
        return choose_endpoint(target.path, target_endpoint_config(cfg_, volume), target_ssh_options(target), log_,
                               err);
    }

    // Restore and verify read from the backup side and need its lock table.
    std::unique_ptr<LocalEndpoint> backup(const VolumeConfig &volume, const TargetConfig &target, std::string *err) {
        if (target.path.find("://") != std::string::npos) {
            *err = "target " + target.path + " is not a local backup directory";
            return nullptr;
        }
        EndpointConfig ec = target_endpoint_config(cfg_, volume);
        ec.path = absolute_path(target.path);
        return std::make_unique<LocalEndpoint>(ec, log_);
    }

    TransferOptions transfer_options(const TargetConfig &target) const {
        TransferOptions options = target_transfer_options(target);
        if (opts_.force) options.force = true;
        return options;
    }

private:
    const Config &cfg_;
    const CliOptions &opts_;
    Log &log_;
    TransactionLog journal_;
};

static bool take_snapshot(Session &session, const VolumeConfig &volume, LocalEndpoint &source, Log &log) {
    TransactionScope scope(&session.journal(), "snapshot", volume.path, source.get_id(), "", "");
    Subvolume subvolume(volume.path, source, log);
    Error err;
    Snapshot snapshot;
    if (!subvolume.prepare(&err) || !subvolume.take_snapshot(volume.subvolume_sync, &snapshot, &err)) {
        log.error("%s", err.message.c_str());
        scope.fail(err.message);
        return false;
    }
    scope.set_details(snapshot.name());
    scope.complete();
    return true;
}

static bool transfer_volume(Session &session, const Config &cfg, const CliOptions &opts, const VolumeConfig &volume,
                            LocalEndpoint &source, Log &log) {
    bool ok = true;
    for (const auto &target : volume.targets) {
        std::string err_text;
        std::unique_ptr<Endpoint> destination = session.target(volume, target, &err_text);
        if (!destination) {
            log.error("%s", err_text.c_str());
            ok = false;
            continue;
        }
        TransferEngine engine(&session.journal(), log);
        ChunkedTransferManager chunks(cfg.state_dir, target.chunk_size, log);
        engine.set_chunked_manager(&chunks);

        SyncOptions options;
        options.keep_backups = volume.keep_backups;
        options.incremental = volume.incremental && !opts.no_incremental;
        options.only = opts.snapshot_name;
        options.transfer = session.transfer_options(target);

        SyncReport report;
        Error err;
        if (!sync_snapshots(source, *destination, engine, options, log, &report, &err)) {
            log.error("transfers to %s aborted: %s", destination->describe().c_str(), report.abort_message.c_str());
        }
        if (!report.ok()) ok = false;
    }
    return ok;
}

static bool prune_volume(Session &session, const VolumeConfig &volume, LocalEndpoint &source, Log &log) {
    bool ok = true;
    Error err;
    std::vector<Snapshot> deleted;
    if (volume.keep_snapshots > 0) {
        log.heading("Pruning " + source.describe());
        if (!source.prune(volume.keep_snapshots, &deleted, &err)) {
            log.error("%s", err.message.c_str());
            return false;
        }
    }
    if (volume.keep_backups <= 0) return ok;
    if (!source.load_locks(&err)) {
        log.error("%s", err.message.c_str());
        return false;
    }
    for (const auto &target : volume.targets) {
        std::string err_text;
        std::unique_ptr<Endpoint> destination = session.target(volume, target, &err_text);
        if (!destination) {
            log.error("%s", err_text.c_str());
            ok = false;
            continue;
        }
        log.heading("Pruning " + destination->describe());
        if (!destination->delete_old_snapshots(volume.keep_backups, source.locks().entries(), &deleted, &err)) {
            log.error("%s", err.message.c_str());
            ok = false;
        }
    }
    return ok;
}

static void print_snapshots(Endpoint &endpoint, const LockMap *locks, Log &log) {
    std::vector<Snapshot> snapshots;
    Error err;
    if (!endpoint.list_snapshots(true, &snapshots, &err)) {
        log.error("%s", err.message.c_str());
        return;
    }
    std::printf("%s\n", endpoint.describe().c_str());
    if (snapshots.empty()) std::printf("  <none>\n");
    for (const auto &s : snapshots) {
        std::string flags;
        if (locks) {
            auto it = locks->find(s.name());
            if (it != locks->end()) {
                for (const auto &id : it->second.locks) flags += " [lock " + id + "]";
                for (const auto &id : it->second.parent_locks) flags += " [parent " + id + "]";
            }
        }
        std::printf("  %s%s\n", s.name().c_str(), flags.c_str());
    }
}

static int cmd_list(Session &session, const std::vector<const VolumeConfig *> &volumes, Log &log) {
    for (const VolumeConfig *volume : volumes) {
        std::unique_ptr<LocalEndpoint> source = session.source(*volume);
        Error err;
        if (!source->load_locks(&err)) {
            log.error("%s", err.message.c_str());
            return 1;
        }
        print_snapshots(*source, &source->locks().entries(), log);
        for (const auto &target : volume->targets) {
            std::string err_text;
            std::unique_ptr<Endpoint> destination = session.target(*volume, target, &err_text);
            if (!destination) {
                log.error("%s", err_text.c_str());
                continue;
            }
            print_snapshots(*destination, nullptr, log);
        }
    }
    return 0;
}

static int cmd_transfers(const Config &cfg, const CliOptions &opts, Log &log) {
    ChunkedTransferManager manager(cfg.state_dir, 0, log);
    if (opts.cleanup) {
        int removed = manager.cleanup_completed();
        std::printf("removed %d completed transfer(s)\n", removed);
    }
    std::vector<TransferManifest> transfers;
    Error err;
    if (!manager.list_transfers(&transfers, &err)) {
        log.error("%s", err.message.c_str());
        return 1;
    }
    if (transfers.empty()) std::printf("no chunked transfers\n");
    for (const auto &m : transfers) {
        int point = m.resume_point();
        std::printf("%s  %-12s %s -> %s  %d chunk(s), %s", m.transfer_id.c_str(), transfer_status_label(m.status),
                    m.snapshot_name.c_str(), m.destination.c_str(), m.chunk_count(),
                    format_size(m.total_size).c_str());
        if (m.status != TransferStatus::Completed && point >= 0) std::printf(", resume at chunk %d", point);
        std::printf("\n");
        if (!m.error_message.empty()) std::printf("    %s\n", m.error_message.c_str());
    }
    return 0;
}

static int cmd_resume(Session &session, const Config &cfg, const CliOptions &opts, Log &log) {
    if (opts.args.size() != 1) {
        std::printf("resume requires a transfer id\n");
        return 2;
    }
    const std::string &id = opts.args[0];
    ChunkedTransferManager probe(cfg.state_dir, 0, log);
    TransferManifest manifest;
    Error err;
    if (!probe.load_manifest(id, &manifest, &err)) {
        log.error("%s", err.message.c_str());
        return 1;
    }
    for (const auto &volume : cfg.volumes) {
        for (const auto &target : volume.targets) {
            std::string err_text;
            std::unique_ptr<Endpoint> destination = session.target(volume, target, &err_text);
            if (!destination || destination->get_id() != manifest.destination) continue;

            ChunkedTransferManager manager(cfg.state_dir, target.chunk_size, log);
            TransactionScope scope(&session.journal(), "chunked_transfer", manifest.source, manifest.destination,
                                   manifest.snapshot_name, manifest.parent_name);
            scope.set_details("resume of " + id);
            TransferManifest resumed;
            if (!manager.resume(id, *destination, &resumed, &err)) {
                log.error("%s", err.message.c_str());
                scope.fail(err.message);
                return 1;
            }
            scope.set_size(static_cast<int64_t>(resumed.total_size));
            scope.complete();

            std::unique_ptr<LocalEndpoint> source = session.source(volume);
            Snapshot snapshot;
            if (source->get_id() == manifest.source &&
                Snapshot::parse(source->path(), source->prefix(), manifest.snapshot_name, &snapshot)) {
                const std::string lock_id = destination->get_id();
                if (!source->set_lock(snapshot, lock_id, false, false, &err)) log.warn("%s", err.message.c_str());
                Snapshot parent;
                if (!manifest.parent_name.empty() &&
                    Snapshot::parse(source->path(), source->prefix(), manifest.parent_name, &parent) &&
                    !source->set_lock(parent, lock_id, false, true, &err)) {
                    log.warn("%s", err.message.c_str());
                }
            }
            log.info("transfer %s completed", id.c_str());
            return 0;
        }
    }
    log.error("no configured target matches %s", manifest.destination.c_str());
    return 1;
}

static int cmd_unlock(Session &session, const Config &cfg, const CliOptions &opts, Log &log) {
    if (opts.args.empty() || opts.args.size() > 2) {
        std::printf("unlock requires a volume and an optional lock id\n");
        return 2;
    }
    const VolumeConfig *volume = find_volume(cfg, opts.args[0]);
    if (!volume) {
        std::printf("no such volume %s\n", opts.args[0].c_str());
        return 2;
    }
    std::string lock_id = opts.args.size() == 2 ? opts.args[1] : "";
    std::unique_ptr<LocalEndpoint> source = session.source(*volume);
    Error err;
    if (!source->release_locks(lock_id, &err)) {
        log.error("%s", err.message.c_str());
        return 1;
    }
    std::string what = lock_id.empty() ? "all locks" : "lock " + lock_id;
    log.info("released %s on %s", what.c_str(), source->describe().c_str());
    return 0;
}

static const TargetConfig *pick_target(const VolumeConfig &volume, int index) {
    if (volume.targets.empty()) return nullptr;
    if (index < 0) index = 0;
    if (static_cast<size_t>(index) >= volume.targets.size()) return nullptr;
    return &volume.targets[index];
}

static int cmd_restore(Session &session, const Config &cfg, const CliOptions &opts, Log &log) {
    if (opts.args.size() != 1) {
        std::printf("restore requires a volume\n");
        return 2;
    }
    const VolumeConfig *volume = find_volume(cfg, opts.args[0]);
    if (!volume) {
        std::printf("no such volume %s\n", opts.args[0].c_str());
        return 2;
    }
    const TargetConfig *target = pick_target(*volume, opts.target_index);
    if (!target) {
        std::printf("no such target for %s\n", volume->path.c_str());
        return 2;
    }
    RestoreOptions options;
    options.snapshot_name = opts.snapshot_name;
    options.all = opts.all;
    options.incremental = !opts.no_incremental;
    options.dry_run = opts.dry_run;
    options.transfer = session.transfer_options(*target);
    options.transfer.chunked = false;
    if (!opts.before.empty()) {
        if (!parse_timestamp(opts.before, &options.before)) {
            std::printf("invalid --before %s (expected YYYYMMDD-HHMMSS)\n", opts.before.c_str());
            return 2;
        }
        options.has_before = true;
    }

    std::string err_text;
    std::unique_ptr<LocalEndpoint> backup = session.backup(*volume, *target, &err_text);
    if (!backup) {
        log.error("%s", err_text.c_str());
        return 2;
    }
    EndpointConfig local_config = source_endpoint_config(cfg, *volume);
    if (!opts.to.empty()) local_config.path = absolute_path(opts.to);
    LocalEndpoint local(local_config, log);

    TransferEngine engine(&session.journal(), log);
    RestoreReport report;
    Error err;
    if (!restore_snapshots(*backup, local, engine, options, log, &report, &err)) {
        log.error("%s", err.message.c_str());
        return 1;
    }
    if (opts.dry_run) {
        for (const auto &s : report.plan) std::printf("would restore %s\n", s.name().c_str());
    }
    return report.ok() ? 0 : 1;
}

static int cmd_verify(Session &session, const Config &cfg, const CliOptions &opts, Log &log) {
    if (opts.args.size() != 1) {
        std::printf("verify requires a volume\n");
        return 2;
    }
    const VolumeConfig *volume = find_volume(cfg, opts.args[0]);
    if (!volume) {
        std::printf("no such volume %s\n", opts.args[0].c_str());
        return 2;
    }
    const TargetConfig *target = pick_target(*volume, opts.target_index);
    if (!target) {
        std::printf("no such target for %s\n", volume->path.c_str());
        return 2;
    }
    VerifyLevel level;
    if (!parse_verify_level(opts.level, &level)) {
        std::printf("invalid --level %s\n", opts.level.c_str());
        return 2;
    }
    std::string err_text;
    std::unique_ptr<LocalEndpoint> backup = session.backup(*volume, *target, &err_text);
    if (!backup) {
        log.error("%s", err_text.c_str());
        return 2;
    }
    std::unique_ptr<LocalEndpoint> source = session.source(*volume);

    TransactionScope scope(&session.journal(), "verify", source->get_id(), backup->get_id(), opts.snapshot_name, "");
    VerifyReport report;
    Error err;
    if (!verify_backups(*backup, source.get(), level, opts.snapshot_name, log, &report, &err)) {
        log.error("%s", err.message.c_str());
        scope.fail(err.message);
        return 1;
    }
    for (const auto &e : report.errors) log.error("%s", e.c_str());
    std::printf("%s verification of %s: %zu passed, %zu failed, %zu error(s)\n", verify_level_label(report.level),
                report.location.c_str(), report.passed(), report.failed(), report.errors.size());
    scope.set_details(verify_level_label(report.level));
    if (report.ok()) {
        scope.complete();
        return 0;
    }
    scope.fail(std::to_string(report.failed() + report.errors.size()) + " problem(s)");
    return 1;
}

int main(int argc, char **argv) {
    CliOptions opts;
    std::string err;
    std::signal(SIGPIPE, SIG_IGN);

    if (!parse_args(argc, argv, &opts, &err)) {
        std::printf("%s\n", err.c_str());
        print_usage();
        return 2;
    }
    print_banner();
    if (opts.show_version) return 0;
    if (opts.command.empty()) {
        print_usage();
        return 2;
    }

    Config cfg;
    if (!parse_config(opts.config_path, &cfg, &err)) {
        std::printf("failed to load config %s: %s\n", opts.config_path.c_str(), err.c_str());
        return 2;
    }

    Log log(stdout, cfg.log_level);
    const char *env_level = std::getenv("SNAPVAULT_LOG_LEVEL");
    LogLevel level;
    if (env_level && parse_log_level(env_level, &level)) log.set_level(level);
    if (opts.quiet) log.set_level(LogLevel::Warning);
    if (opts.verbose) log.set_level(LogLevel::Debug);
    log.debug("loaded config %s with %zu volume(s)", opts.config_path.c_str(), cfg.volumes.size());

    std::vector<const VolumeConfig *> volumes = select_volumes(cfg, opts);
    if (!opts.volumes.empty() && volumes.size() != opts.volumes.size()) {
        std::printf("no such volume(s) in %s\n", opts.config_path.c_str());
        return 2;
    }

    Session session(cfg, opts, log);
    const std::string &cmd = opts.command;
    if (cmd == "list") return cmd_list(session, volumes, log);
    if (cmd == "transfers") return cmd_transfers(cfg, opts, log);
    if (cmd == "resume") return cmd_resume(session, cfg, opts, log);
    if (cmd == "unlock") return cmd_unlock(session, cfg, opts, log);
    if (cmd == "restore") return cmd_restore(session, cfg, opts, log);
    if (cmd == "verify") return cmd_verify(session, cfg, opts, log);
    if (cmd != "run" && cmd != "snapshot" && cmd != "transfer" && cmd != "prune") {
        std::printf("unknown command %s\n", cmd.c_str());
        print_usage();
        return 2;
    }

    char timebuf[64];
    format_time(timebuf, sizeof(timebuf), std::time(nullptr));
    std::printf("%s\n", timebuf);

    bool ok = true;
    for (const VolumeConfig *volume : volumes) {
        log.heading(volume->path);
        std::unique_ptr<LocalEndpoint> source = session.source(*volume);
        if (cmd == "run" || cmd == "snapshot") {
            if (!take_snapshot(session, *volume, *source, log)) {
                ok = false;
                continue;
            }
        }
        if (cmd == "run" || cmd == "transfer") {
            Error prep;
            if (!source->prepare(&prep)) {
                log.error("%s", prep.message.c_str());
                ok = false;
                continue;
            }
            if (!transfer_volume(session, cfg, opts, *volume, *source, log)) ok = false;
        }
        if (cmd == "run" || cmd == "prune") {
            if (!prune_volume(session, *volume, *source, log)) ok = false;
        }
    }

    format_time(timebuf, sizeof(timebuf), std::time(nullptr));
    std::printf("%s\n", timebuf);
    return ok ? 0 : 1;
}
