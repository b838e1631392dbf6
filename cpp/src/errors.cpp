// docflow/cpp/src/errors.cpp
#include "docflow/errors.h"

namespace docflow {

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok: return "ok";
        case ErrorCode::IoError: return "io_error";
        case ErrorCode::ParseError: return "parse_error";
        case ErrorCode::HandlerError: return "handler_error";
        case ErrorCode::InvalidArgs: return "invalid_args";
        case ErrorCode::ConfigError: return "config_error";
    }
    return "unknown";
}

} // namespace docflow
