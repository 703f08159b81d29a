// errors.h - Run status codes shared by every comparison entry point
// Part of simscan - pairwise document similarity reports

#ifndef SIMSCAN_ERRORS_H
#define SIMSCAN_ERRORS_H

#include <cstdint>

namespace simscan {

enum class RunError : uint8_t {
    NONE,
    PATH_NOT_FOUND,        // Input file/dir or output dir does not exist
    MINIMUM_DOCUMENTS,     // Full mode needs at least two documents
    NO_CANDIDATES,         // Targeted mode has nothing left to compare against
    UNSUPPORTED_FORMAT,    // Extension unknown or extraction produced nothing
    CONFIGURATION,         // Non-positive block size
    REPORT_NOT_PERSISTED,  // Summary did not appear before the deadline
    IO,                    // A report file could not be written
    TOKEN_OVERFLOW,        // Intern table exhausted
};

inline const char* run_error_name(RunError e) {
    switch (e) {
        case RunError::NONE: return "NONE";
        case RunError::PATH_NOT_FOUND: return "PATH_NOT_FOUND";
        case RunError::MINIMUM_DOCUMENTS: return "MINIMUM_DOCUMENTS";
        case RunError::NO_CANDIDATES: return "NO_CANDIDATES";
        case RunError::UNSUPPORTED_FORMAT: return "UNSUPPORTED_FORMAT";
        case RunError::CONFIGURATION: return "CONFIGURATION";
        case RunError::REPORT_NOT_PERSISTED: return "REPORT_NOT_PERSISTED";
        case RunError::IO: return "IO";
        case RunError::TOKEN_OVERFLOW: return "TOKEN_OVERFLOW";
    }
    return "?";
}

} // namespace simscan

#endif // SIMSCAN_ERRORS_H
