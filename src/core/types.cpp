#include "types.hpp"

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::None:           return "No error";
    case ErrorKind::Config:         return "Configuration error";
    case ErrorKind::Connection:     return "SSH connection error";
    case ErrorKind::Authentication: return "SSH authentication error";
    case ErrorKind::Channel:        return "SSH channel error";
    case ErrorKind::Relay:          return "Relay error";
    case ErrorKind::Service:        return "Service error";
    case ErrorKind::ControlPlane:   return "Control plane error";
    case ErrorKind::Io:             return "IO error";
    }
    return "Unknown error";
}
