#include "pipeline_error.h"

namespace gearpix::core {

const char* error_code_name(ErrorCode code) {
    switch (code) {
    case ErrorCode::None:
        return "none";
    case ErrorCode::EmptyImage:
        return "empty image";
    case ErrorCode::DimensionMismatch:
        return "dimension mismatch";
    case ErrorCode::InvalidDimension:
        return "invalid dimension";
    case ErrorCode::MissingResource:
        return "missing resource";
    case ErrorCode::ImageLoad:
        return "image load";
    case ErrorCode::ImageSave:
        return "image save";
    case ErrorCode::Archive:
        return "archive";
    case ErrorCode::InvalidArgument:
        return "invalid argument";
    }
    return "unknown";
}

} // namespace gearpix::core
