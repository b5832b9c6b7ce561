#include "link/Errors.hpp"

namespace ql::link {

std::string to_string(const ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidCode: return "invalid_code";
        case ErrorCode::InvalidUrl: return "invalid_url";
        case ErrorCode::CodeTaken: return "code_taken";
        case ErrorCode::Conflict: return "conflict";
        case ErrorCode::GenerationExhausted: return "generation_exhausted";
        case ErrorCode::NotFound: return "not_found";
        case ErrorCode::RenderError: return "render_error";
        case ErrorCode::StorageUploadError: return "storage_upload_error";
        default: throw std::invalid_argument("Unknown ErrorCode enum value");
    }
}

unsigned int http_status(const ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidCode:
        case ErrorCode::InvalidUrl: return 400;
        case ErrorCode::NotFound: return 404;
        case ErrorCode::CodeTaken:
        case ErrorCode::Conflict: return 409;
        case ErrorCode::GenerationExhausted: return 500;
        case ErrorCode::RenderError:
        case ErrorCode::StorageUploadError: return 502;
        default: return 500;
    }
}

}
