#pragma once
#include <string>

namespace terrascope {

enum class ErrorKind {
    NONE,
    CATALOG_LOAD,            // Template file missing or malformed
    SERIALIZATION_AMBIGUITY, // Input carried a kind the Value model cannot hold
    PROCESS_EXECUTION,       // terraform could not be launched
    WRITE,                   // Rendered document could not be written
    INVALID_INPUT,
    NOT_FOUND
};

inline std::string error_kind_to_string(ErrorKind k) {
    switch (k) {
        case ErrorKind::NONE: return "NONE";
        case ErrorKind::CATALOG_LOAD: return "CATALOG_LOAD";
        case ErrorKind::SERIALIZATION_AMBIGUITY: return "SERIALIZATION_AMBIGUITY";
        case ErrorKind::PROCESS_EXECUTION: return "PROCESS_EXECUTION";
        case ErrorKind::WRITE: return "WRITE";
        case ErrorKind::INVALID_INPUT: return "INVALID_INPUT";
        case ErrorKind::NOT_FOUND: return "NOT_FOUND";
        default: return "UNKNOWN";
    }
}

struct OpResult {
    bool success = true;
    ErrorKind error = ErrorKind::NONE;
    std::string message;

    static OpResult ok(const std::string& msg = "") {
        return {true, ErrorKind::NONE, msg};
    }

    static OpResult fail(ErrorKind kind, const std::string& msg) {
        return {false, kind, msg};
    }

    explicit operator bool() const { return success; }
};

}
