// docflow/cpp/include/docflow/errors.h
#pragma once
#include <stdexcept>
#include <string>
#include <utility>

namespace docflow {

enum class ErrorCode {
    Ok = 0,
    IoError,
    ParseError,
    HandlerError,
    InvalidArgs,
    ConfigError,
};

const char* error_code_name(ErrorCode code);

class DocflowException : public std::runtime_error {
public:
    DocflowException(ErrorCode code, const std::string& msg)
        : std::runtime_error(msg), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

// temp file / read / write failures on a content stream
class StreamException : public DocflowException {
public:
    explicit StreamException(const std::string& msg)
        : DocflowException(ErrorCode::IoError, msg) {}
};

class ParseException : public DocflowException {
public:
    explicit ParseException(const std::string& msg)
        : DocflowException(ErrorCode::ParseError, msg) {}
};

// failure inside a tagger/transformer/filter/splitter or a condition,
// already carrying the handler name and the document reference
class HandlerException : public DocflowException {
public:
    HandlerException(const std::string& msg,
                     std::string handler,
                     std::string reference,
                     ErrorCode code = ErrorCode::HandlerError)
        : DocflowException(code, msg),
          handler_(std::move(handler)),
          reference_(std::move(reference)) {}

    const std::string& handler() const { return handler_; }
    const std::string& reference() const { return reference_; }

private:
    std::string handler_;
    std::string reference_;
};

class ImporterException : public DocflowException {
public:
    explicit ImporterException(const std::string& msg,
                               ErrorCode code = ErrorCode::InvalidArgs)
        : DocflowException(code, msg) {}
};

} // namespace docflow
