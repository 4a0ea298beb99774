#include "util/Error.h"

const char* ErrorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "None";
        case ErrorCode::DataUnavailable: return "DataUnavailable";
        case ErrorCode::AssetMissing: return "AssetMissing";
        case ErrorCode::UnsupportedAxis: return "UnsupportedAxis";
        case ErrorCode::EncodingFailure: return "EncodingFailure";
        case ErrorCode::InvalidInput: return "InvalidInput";
        case ErrorCode::ParseFailure: return "ParseFailure";
        case ErrorCode::DownloadFailure: return "DownloadFailure";
    }
    return "Unknown";
}

bool SetError(Error* error, ErrorCode code, const std::string& message) {
    if (error) {
        error->code = code;
        error->message = message;
    }
    return false;
}

std::string FormatError(const Error& error) {
    if (error.message.empty()) {
        return ErrorCodeName(error.code);
    }
    return std::string(ErrorCodeName(error.code)) + ": " + error.message;
}
