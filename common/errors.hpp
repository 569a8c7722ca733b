#pragma once

// ============================================================
// errors.hpp -- Transfer error taxonomy
// ============================================================

#include "platform.hpp"
#include <stdexcept>
#include <string>
#include <vector>

// Retry class of a failure
enum class ErrorKind {
    TRANSIENT,   // connection or timeout: retry the job
    CORRUPTION,  // bad chunk on the wire: resend the chunk, bounded
    FATAL,       // never retried
};

enum class ErrorCode {
    CONNECTION,
    TIMEOUT,
    AUTHENTICATION,
    INTEGRITY,
    MALFORMED_MANIFEST,
    REASSEMBLY,
};

inline const char* error_code_name(ErrorCode c) {
    switch (c) {
        case ErrorCode::CONNECTION:         return "ConnectionError";
        case ErrorCode::TIMEOUT:            return "TimeoutError";
        case ErrorCode::AUTHENTICATION:     return "AuthenticationError";
        case ErrorCode::INTEGRITY:          return "IntegrityError";
        case ErrorCode::MALFORMED_MANIFEST: return "MalformedManifestError";
        case ErrorCode::REASSEMBLY:         return "ReassemblyError";
    }
    return "TransferError";
}

inline ErrorKind error_kind_of(ErrorCode c) {
    switch (c) {
        case ErrorCode::CONNECTION:
        case ErrorCode::TIMEOUT:            return ErrorKind::TRANSIENT;
        case ErrorCode::AUTHENTICATION:     return ErrorKind::CORRUPTION;
        case ErrorCode::INTEGRITY:
        case ErrorCode::MALFORMED_MANIFEST:
        case ErrorCode::REASSEMBLY:         return ErrorKind::FATAL;
    }
    return ErrorKind::FATAL;
}

class TransferError : public std::runtime_error {
public:
    TransferError(ErrorCode code, const std::string& msg)
        : std::runtime_error(msg), code_(code) {}

    ErrorCode code() const { return code_; }
    ErrorKind kind() const { return error_kind_of(code_); }
    const char* name() const { return error_code_name(code_); }

private:
    ErrorCode code_;
};

class ConnectionError : public TransferError {
public:
    explicit ConnectionError(const std::string& msg)
        : TransferError(ErrorCode::CONNECTION, msg) {}
};

class TimeoutError : public TransferError {
public:
    explicit TimeoutError(const std::string& msg)
        : TransferError(ErrorCode::TIMEOUT, msg) {}
};

class AuthenticationError : public TransferError {
public:
    explicit AuthenticationError(const std::string& msg)
        : TransferError(ErrorCode::AUTHENTICATION, msg) {}
};

class IntegrityError : public TransferError {
public:
    explicit IntegrityError(const std::string& msg)
        : TransferError(ErrorCode::INTEGRITY, msg) {}
};

class MalformedManifestError : public TransferError {
public:
    explicit MalformedManifestError(const std::string& msg)
        : TransferError(ErrorCode::MALFORMED_MANIFEST, msg) {}
};

// Raised after a full reassembly pass; carries every faulty chunk index
class ReassemblyError : public TransferError {
public:
    ReassemblyError(const std::string& msg, std::vector<u32> faulty)
        : TransferError(ErrorCode::REASSEMBLY, msg), faulty_(std::move(faulty)) {}

    const std::vector<u32>& faulty_chunks() const { return faulty_; }

private:
    std::vector<u32> faulty_;
};
