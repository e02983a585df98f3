#ifndef SNAPVAULT_ENDPOINT_FACTORY_H
#define SNAPVAULT_ENDPOINT_FACTORY_H

#include <memory>
#include <string>

#include "endpoint.h"
#include "ssh_endpoint.h"

namespace snapvault {

// ssh://[user@]host[:port]/path
bool parse_ssh_url(const std::string &url, SshOptions *ssh, std::string *path, std::string *err);

// Builds the endpoint for a target spec: `shell://cmd`, `ssh://...` or a
// local path. `ssh` supplies key, options and sudo for ssh targets; the
// user, host, port and path come from the url.
std::unique_ptr<Endpoint> choose_endpoint(const std::string &spec, const EndpointConfig &config,
                                          const SshOptions &ssh, Log &log, std::string *err);

}

#endif
