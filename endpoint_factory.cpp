#include "endpoint_factory.h"

#include <cstdlib>

#include "local_endpoint.h"
#include "shell_endpoint.h"
#include "util.h"

namespace snapvault {

bool parse_ssh_url(const std::string &url, SshOptions *ssh, std::string *path, std::string *err) {
    const std::string scheme = "ssh://";
    if (url.compare(0, scheme.size(), scheme) != 0) {
        *err = "not an ssh url: " + url;
        return false;
    }
    std::string rest = url.substr(scheme.size());
    size_t slash = rest.find('/');
    if (slash == std::string::npos || slash + 1 >= rest.size()) {
        *err = "ssh url has no path: " + url;
        return false;
    }
    std::string authority = rest.substr(0, slash);
    *path = rest.substr(slash);

    size_t at = authority.rfind('@');
    if (at != std::string::npos) {
        ssh->username = authority.substr(0, at);
        authority = authority.substr(at + 1);
    }
    size_t colon = authority.rfind(':');
    if (colon != std::string::npos) {
        std::string port = authority.substr(colon + 1);
        char *end = nullptr;
        long value = std::strtol(port.c_str(), &end, 10);
        if (port.empty() || *end != '\0' || value <= 0 || value > 65535) {
            *err = "invalid ssh port in " + url;
            return false;
        }
        ssh->port = static_cast<int>(value);
        authority = authority.substr(0, colon);
    }
    if (authority.empty()) {
        *err = "ssh url has no host: " + url;
        return false;
    }
    ssh->hostname = authority;
    return true;
}

std::unique_ptr<Endpoint> choose_endpoint(const std::string &spec, const EndpointConfig &config,
                                          const SshOptions &ssh, Log &log, std::string *err) {
    const std::string shell_scheme = "shell://";
    if (spec.compare(0, shell_scheme.size(), shell_scheme) == 0) {
        std::string command = spec.substr(shell_scheme.size());
        if (command.empty()) {
            *err = "empty shell command in " + spec;
            return nullptr;
        }
        return std::make_unique<ShellEndpoint>(command, config, log);
    }
    if (spec.compare(0, 6, "ssh://") == 0) {
        SshOptions options = ssh;
        EndpointConfig remote = config;
        if (!parse_ssh_url(spec, &options, &remote.path, err)) return nullptr;
        return std::make_unique<SshEndpoint>(remote, options, log);
    }
    if (spec.find("://") != std::string::npos) {
        *err = "unsupported endpoint scheme: " + spec;
        return nullptr;
    }
    EndpointConfig local = config;
    local.path = absolute_path(spec);
    return std::make_unique<LocalEndpoint>(local, log);
}

}
