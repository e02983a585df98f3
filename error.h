#ifndef SNAPVAULT_ERROR_H
#define SNAPVAULT_ERROR_H

#include <string>

namespace snapvault {

enum class ErrorKind {
    Abort,
    Transfer,
    InsufficientSpace,
    Restore,
    Verify
};

struct Error {
    ErrorKind kind = ErrorKind::Abort;
    std::string message;
};

const char *error_kind_label(ErrorKind kind);

// Fills *err (when non-null) and returns false so callers can write
// `return set_error(err, ErrorKind::Transfer, "...");`.
bool set_error(Error *err, ErrorKind kind, const std::string &message);

// Keeps the message of a lower-level error but reclassifies it.
bool rethrow_as(Error *err, ErrorKind kind, const std::string &context);

}

#endif
