#pragma once

#include <string>

enum class ErrorCode {
    None = 0,
    DataUnavailable,
    AssetMissing,
    UnsupportedAxis,
    EncodingFailure,
    InvalidInput,
    ParseFailure,
    DownloadFailure
};

struct Error {
    ErrorCode code = ErrorCode::None;
    std::string message;
};

const char* ErrorCodeName(ErrorCode code);

// Fills *error when it is non-null and returns false, so failure paths read
// `return SetError(error, ErrorCode::AssetMissing, "...");`.
bool SetError(Error* error, ErrorCode code, const std::string& message);

std::string FormatError(const Error& error);
