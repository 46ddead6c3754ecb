#include "errors.hpp"

namespace errors {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Input:       return "input";
        case ErrorKind::Rendezvous:  return "rendezvous";
        case ErrorKind::Network:     return "network";
        case ErrorKind::Crypto:      return "crypto";
        case ErrorKind::Compression: return "compression";
        case ErrorKind::Cancelled:   return "cancelled";
        case ErrorKind::Storage:     return "storage";
        case ErrorKind::Internal:    return "internal";
    }
    return "unknown";
}

} // namespace errors
