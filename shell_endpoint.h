#ifndef SNAPVAULT_SHELL_ENDPOINT_H
#define SNAPVAULT_SHELL_ENDPOINT_H

#include <string>
#include <vector>

#include "endpoint.h"

namespace snapvault {

// Feeds the stream to an arbitrary shell command (`shell://cmd`). Has no
// snapshot listing, so every transfer to it is a full one.
class ShellEndpoint : public Endpoint {
public:
    ShellEndpoint(const std::string &command, const EndpointConfig &config, Log &log);

    const std::string &command() const { return command_; }

    std::string get_id() const override { return "shell://" + command_; }
    std::string describe() const override { return "(Shell) " + command_; }

    bool ensure_directory(Error *) override { return true; }
    bool get_space_info(SpaceInfo *out, Error *err) override;
    bool snapshot_exists(const std::string &, Error *) override { return false; }

    std::vector<std::string> receive_argv(const std::string &decompress) const override;

protected:
    bool list_directory(std::vector<std::string> *, Error *) override { return true; }
    std::vector<std::string> wrap_command(const std::vector<std::string> &argv) const override { return argv; }
    std::vector<std::vector<std::string>> deletion_commands(const std::vector<Snapshot> &) const override {
        return {};
    }

private:
    std::string command_;
};

}

#endif
