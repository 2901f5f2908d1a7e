#pragma once

#include <string>
#include <utility>

/// Failure taxonomy shared by every stage of the update flow.
/// Only LaunchFailed is fatal; everything else degrades to the last
/// known good version.
enum class ErrorKind {
    None,
    CorruptRecord,
    CheckFailed,
    VerificationFailed,
    InstallFailed,
    PromotionFailed,
    LaunchFailed,
    Cancelled,
    LockBusy
};

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:               return "none";
        case ErrorKind::CorruptRecord:      return "corrupt-record";
        case ErrorKind::CheckFailed:        return "check-failed";
        case ErrorKind::VerificationFailed: return "verification-failed";
        case ErrorKind::InstallFailed:      return "install-failed";
        case ErrorKind::PromotionFailed:    return "promotion-failed";
        case ErrorKind::LaunchFailed:       return "launch-failed";
        case ErrorKind::Cancelled:          return "cancelled";
        case ErrorKind::LockBusy:           return "lock-busy";
    }
    return "unknown";
}

struct StepResult {
    bool success = false;
    ErrorKind error = ErrorKind::None;
    std::string message;

    static StepResult ok() { return {true, ErrorKind::None, ""}; }
    static StepResult fail(ErrorKind kind, std::string msg) {
        return {false, kind, std::move(msg)};
    }
};
