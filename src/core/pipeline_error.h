#pragma once

#include <string>
#include <utility>

namespace gearpix::core {

enum class ErrorCode {
    None,
    EmptyImage,
    DimensionMismatch,
    InvalidDimension,
    MissingResource,
    ImageLoad,
    ImageSave,
    Archive,
    InvalidArgument,
};

struct PipelineError {
    ErrorCode code = ErrorCode::None;
    std::string message;

    [[nodiscard]] bool ok() const { return code == ErrorCode::None; }
};

inline bool fail(PipelineError& error, ErrorCode code, std::string message) {
    error.code = code;
    error.message = std::move(message);
    return false;
}

const char* error_code_name(ErrorCode code);

} // namespace gearpix::core
