#ifndef SNAPVAULT_SSH_ENDPOINT_H
#define SNAPVAULT_SSH_ENDPOINT_H

#include <string>
#include <vector>

#include "endpoint.h"

namespace snapvault {

struct SshOptions {
    std::string hostname;
    std::string username;
    int port = 0;
    std::string identity_file;
    std::vector<std::string> ssh_opts;   // each passed as `-o value`
    bool ssh_sudo = false;
};

// Receive-only endpoint on another host. Every operation is one ssh
// invocation carrying a single quoted remote command line.
class SshEndpoint : public Endpoint {
public:
    SshEndpoint(const EndpointConfig &config, const SshOptions &ssh, Log &log);

    const SshOptions &ssh() const { return ssh_; }

    std::string get_id() const override;
    std::string describe() const override { return "(SSH) " + get_id(); }
    bool is_remote() const override { return true; }

    bool ensure_directory(Error *err) override;
    bool get_space_info(SpaceInfo *out, Error *err) override;
    bool snapshot_exists(const std::string &name, Error *err) override;

    bool supports_direct_pipe() const override { return true; }
    std::vector<std::string> direct_buffer_command() const override;

    bool supports_staged_receive() const override { return true; }
    bool open_staged_receive(const std::string &transfer_id, uint64_t offset, Process *out, Error *err) override;
    bool commit_staged_receive(const std::string &transfer_id, int timeout_seconds, Error *err) override;
    bool discard_staged_receive(const std::string &transfer_id, Error *err) override;

    std::string staging_file(const std::string &transfer_id) const;
    std::vector<std::string> ssh_command() const;

protected:
    bool list_directory(std::vector<std::string> *entries, Error *err) override;
    std::vector<std::string> wrap_command(const std::vector<std::string> &argv) const override;

private:
    std::string connect_string() const;

    SshOptions ssh_;
};

}

#endif
