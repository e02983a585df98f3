#include "shell_endpoint.h"

namespace snapvault {

ShellEndpoint::ShellEndpoint(const std::string &command, const EndpointConfig &config, Log &log)
    : Endpoint(config, log), command_(command) {}

bool ShellEndpoint::get_space_info(SpaceInfo *, Error *err) {
    return set_error(err, ErrorKind::Abort, "space information is not available for " + describe());
}

std::vector<std::string> ShellEndpoint::receive_argv(const std::string &decompress) const {
    if (decompress.empty()) return {"sh", "-c", command_};
    return {"sh", "-c", decompress + " | " + command_};
}

}
