#pragma once

#include <stdexcept>
#include <string>

namespace ql::link {

enum class ErrorCode {
    InvalidCode,
    InvalidUrl,
    CodeTaken,
    Conflict,
    GenerationExhausted,
    NotFound,
    RenderError,
    StorageUploadError
};

// Machine-readable name used in JSON error bodies, e.g. "code_taken".
std::string to_string(ErrorCode code);

unsigned int http_status(ErrorCode code);

class LinkError : public std::runtime_error {
public:
    LinkError(const ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

}
