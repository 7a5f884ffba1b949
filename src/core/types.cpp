#include "types.hpp"

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:               return "none";
        case ErrorKind::InvalidIdentifier:  return "invalid identifier";
        case ErrorKind::MissingLogLocation: return "missing log location";
        case ErrorKind::InvalidLogUrl:      return "invalid log URL";
        case ErrorKind::NotFound:           return "not found";
        case ErrorKind::Unauthorized:       return "unauthorized";
        case ErrorKind::Transport:          return "transport error";
        case ErrorKind::Parse:              return "parse error";
        case ErrorKind::Canceled:           return "canceled";
        case ErrorKind::Config:             return "config error";
    }
    return "unknown";
}
