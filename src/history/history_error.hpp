#pragma once
#include <stdexcept>
#include <string>

namespace browsetrail {

enum class HistoryErrorCode {
    UnsupportedPlatform,
    IdentityResolutionFailed,
    SourceNotFound,
    CopyFailed,
    OpenFailed,
    QueryFailed,
};

inline const char* history_error_name(HistoryErrorCode code) {
    switch (code) {
        case HistoryErrorCode::UnsupportedPlatform:      return "UnsupportedPlatform";
        case HistoryErrorCode::IdentityResolutionFailed: return "IdentityResolutionFailed";
        case HistoryErrorCode::SourceNotFound:           return "SourceNotFound";
        case HistoryErrorCode::CopyFailed:               return "CopyFailed";
        case HistoryErrorCode::OpenFailed:               return "OpenFailed";
        case HistoryErrorCode::QueryFailed:              return "QueryFailed";
    }
    return "Unknown";
}

// Thrown by every stage of history extraction; the tool boundary turns it
// into text.
class HistoryError : public std::runtime_error {
public:
    HistoryError(HistoryErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    HistoryErrorCode code() const { return code_; }

private:
    HistoryErrorCode code_;
};

} // namespace browsetrail
