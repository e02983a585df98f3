#include "ssh_endpoint.h"

#include <cstdlib>
#include <sstream>

#include "util.h"

namespace snapvault {

static const char *STAGING_DIR = ".snapvault-staging";

SshEndpoint::SshEndpoint(const EndpointConfig &config, const SshOptions &ssh, Log &log)
    : Endpoint(config, log), ssh_(ssh) {}

std::string SshEndpoint::connect_string() const {
    if (ssh_.username.empty()) return ssh_.hostname;
    return ssh_.username + "@" + ssh_.hostname;
}

std::string SshEndpoint::get_id() const {
    std::string id = "ssh://" + connect_string();
    if (ssh_.port > 0) id += ":" + std::to_string(ssh_.port);
    return id + path();
}

std::vector<std::string> SshEndpoint::ssh_command() const {
    std::vector<std::string> argv = {"ssh"};
    if (ssh_.port > 0) {
        argv.push_back("-p");
        argv.push_back(std::to_string(ssh_.port));
    }
    if (!ssh_.identity_file.empty()) {
        argv.push_back("-i");
        argv.push_back(ssh_.identity_file);
    }
    for (const auto &opt : ssh_.ssh_opts) {
        argv.push_back("-o");
        argv.push_back(opt);
    }
    argv.push_back(connect_string());
    return argv;
}

std::vector<std::string> SshEndpoint::wrap_command(const std::vector<std::string> &argv) const {
    std::vector<std::string> remote;
    if (ssh_.ssh_sudo) {
        remote.push_back("sudo");
        remote.push_back("-n");
    }
    remote.insert(remote.end(), argv.begin(), argv.end());
    std::vector<std::string> cmd = ssh_command();
    cmd.push_back(shell_join(remote));
    return cmd;
}

std::vector<std::string> SshEndpoint::direct_buffer_command() const {
    if (find_in_path("mbuffer")) return {"mbuffer", "-q", "-m", "128M"};
    if (find_in_path("pv")) return {"pv", "-q", "-B", "128M"};
    return {};
}

bool SshEndpoint::ensure_directory(Error *err) {
    return exec({"mkdir", "-p", path()}, nullptr, err);
}

bool SshEndpoint::get_space_info(SpaceInfo *out, Error *err) {
    std::string output;
    if (!exec({"df", "-B1", "--output=avail,size", path()}, &output, err)) return false;
    std::istringstream in(output);
    std::string header;
    std::getline(in, header);
    unsigned long long avail = 0;
    unsigned long long size = 0;
    if (!(in >> avail >> size)) {
        return set_error(err, ErrorKind::Abort, "unexpected df output from " + describe());
    }
    out->free_bytes = avail;
    out->total_bytes = size;
    return true;
}

bool SshEndpoint::snapshot_exists(const std::string &name, Error *) {
    Error ignored;
    return exec({"test", "-d", path_join(path(), name)}, nullptr, &ignored);
}

bool SshEndpoint::list_directory(std::vector<std::string> *entries, Error *err) {
    std::string output;
    if (!exec({"ls", "-1A", path()}, &output, err)) return false;
    std::istringstream in(output);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) entries->push_back(line);
    }
    return true;
}

std::string SshEndpoint::staging_file(const std::string &transfer_id) const {
    return path_join(path_join(path(), STAGING_DIR), transfer_id + ".stream");
}

bool SshEndpoint::open_staged_receive(const std::string &transfer_id, uint64_t offset, Process *out, Error *err) {
    std::string file = staging_file(transfer_id);
    std::string quoted = shell_quote(file);
    std::string size = std::to_string(offset);
    std::string script = "mkdir -p " + shell_quote(path_dirname(file)) + " && touch " + quoted +
                         " && if [ $(stat -c %s " + quoted + ") -lt " + size +
                         " ]; then echo 'staging file is shorter than the resume offset' >&2; exit 1; fi" +
                         " && truncate -s " + size + " " + quoted + " && exec cat >> " + quoted;
    Process::Options options;
    options.pipe_stdin = true;
    options.null_stdout = true;
    if (!spawn(wrap_command({"sh", "-c", script}), options, out, err)) return false;
    log_.debug("staging %s at offset %llu", file.c_str(), static_cast<unsigned long long>(offset));
    return true;
}

bool SshEndpoint::commit_staged_receive(const std::string &transfer_id, int timeout_seconds, Error *err) {
    std::string file = staging_file(transfer_id);
    std::vector<std::string> receive = {"btrfs", "receive"};
    if (config_.btrfs_debug) receive.push_back("-vv");
    receive.push_back("-f");
    receive.push_back(file);
    receive.push_back(path());
    std::string script = shell_join(receive) + " && rm -f " + shell_quote(file);

    std::vector<std::string> cmd = wrap_command({"sh", "-c", script});
    log_.debug("running: %s", shell_join(cmd).c_str());
    std::string out;
    std::string err_text;
    int rc = run_capture(cmd, &out, &err_text, timeout_seconds);
    if (rc != 0) {
        std::string msg = "receive of staged stream on " + describe() + " failed (exit " + std::to_string(rc) + ")";
        std::string excerpt = tail_excerpt(err_text, 400);
        if (!excerpt.empty()) msg += ": " + excerpt;
        return set_error(err, ErrorKind::Transfer, msg);
    }
    return true;
}

bool SshEndpoint::discard_staged_receive(const std::string &transfer_id, Error *err) {
    return exec({"rm", "-f", staging_file(transfer_id)}, nullptr, err);
}

}
