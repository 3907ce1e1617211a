#include "types.hpp"

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:            return "none";
        case ErrorKind::Config:          return "config";
        case ErrorKind::Resolve:         return "resolve";
        case ErrorKind::Connect:         return "connect";
        case ErrorKind::Handshake:       return "handshake";
        case ErrorKind::Auth:            return "auth";
        case ErrorKind::NotFound:        return "not-found";
        case ErrorKind::LockUnavailable: return "lock-unavailable";
        case ErrorKind::Channel:         return "channel";
        case ErrorKind::Timeout:         return "timeout";
    }
    return "unknown";
}
