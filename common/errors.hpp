#pragma once

// ============================================================
// errors.hpp -- Error taxonomy shared by all contexts
// ============================================================

#include "platform.hpp"
#include <stdexcept>
#include <string>

enum class ErrorKind : u8 {
    CREATION_TIMEOUT    = 1,  // worker context never produced a connection
    JOB_TIMEOUT         = 2,
    TRANSFER_NOT_FOUND  = 3,  // unknown transfer or result id
    INCOMPLETE_TRANSFER = 4,
    ENGINE_FAILURE      = 5,  // verbatim engine / archive reader error
    NO_MEDIA_FOUND      = 6,
    NETWORK_FAILURE     = 7,
    PROTOCOL            = 8,  // malformed frame, checksum mismatch, bad message
};

inline const char* error_kind_name(ErrorKind k) {
    switch (k) {
        case ErrorKind::CREATION_TIMEOUT:    return "CreationTimeout";
        case ErrorKind::JOB_TIMEOUT:         return "JobTimeout";
        case ErrorKind::TRANSFER_NOT_FOUND:  return "TransferNotFound";
        case ErrorKind::INCOMPLETE_TRANSFER: return "IncompleteTransfer";
        case ErrorKind::ENGINE_FAILURE:      return "EngineFailure";
        case ErrorKind::NO_MEDIA_FOUND:      return "NoMediaFound";
        case ErrorKind::NETWORK_FAILURE:     return "NetworkFailure";
        case ErrorKind::PROTOCOL:            return "Protocol";
    }
    return "Unknown";
}

inline ErrorKind error_kind_from_wire(u8 v) {
    if (v >= (u8)ErrorKind::CREATION_TIMEOUT && v <= (u8)ErrorKind::PROTOCOL) {
        return (ErrorKind)v;
    }
    return ErrorKind::PROTOCOL;
}

class RelayError : public std::runtime_error {
public:
    RelayError(ErrorKind kind, const std::string& msg)
        : std::runtime_error(msg), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};
