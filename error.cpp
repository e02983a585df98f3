#include "error.h"

namespace snapvault {

const char *error_kind_label(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Abort:
            return "abort";
        case ErrorKind::Transfer:
            return "transfer";
        case ErrorKind::InsufficientSpace:
            return "insufficient-space";
        case ErrorKind::Restore:
            return "restore";
        case ErrorKind::Verify:
            return "verify";
        default:
            return "unknown";
    }
}

bool set_error(Error *err, ErrorKind kind, const std::string &message) {
    if (err) {
        err->kind = kind;
        err->message = message;
    }
    return false;
}

bool rethrow_as(Error *err, ErrorKind kind, const std::string &context) {
    if (!err) return false;
    err->kind = kind;
    if (!context.empty()) {
        err->message = err->message.empty() ? context : context + ": " + err->message;
    }
    return false;
}

}
