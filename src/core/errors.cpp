/**
 * @file errors.cpp
 * @brief Error code names and SandboxException construction
 *
 * @date 2025
 */

#include "sandcastle/core/errors.hpp"

#include <utility>

namespace sandcastle {
namespace core {

const char* ErrorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::NOT_FOUND:           return "not_found";
        case ErrorCode::CONFLICT:            return "conflict";
        case ErrorCode::QUOTA_EXCEEDED:      return "quota_exceeded";
        case ErrorCode::SANDBOX_NOT_ACTIVE:  return "sandbox_not_active";
        case ErrorCode::RUNTIME_UNAVAILABLE: return "runtime_unavailable";
        case ErrorCode::EXECUTION_TIMEOUT:   return "execution_timeout";
        case ErrorCode::PARTIAL_FAILURE:     return "partial_failure";
        case ErrorCode::PATH_CONFLICT:       return "path_conflict";
        case ErrorCode::CREATION_ERROR:      return "creation_error";
        case ErrorCode::CONTAINER_GONE:      return "container_gone";
        case ErrorCode::CANCELLED:           return "cancelled";
        case ErrorCode::INVALID_ARGUMENT:    return "invalid_argument";
        case ErrorCode::INTERNAL:            return "internal";
    }
    return "internal";
}

SandboxException::SandboxException(ErrorCode code, const std::string& message, ErrorContext context)
    : std::runtime_error(message)
    , code_(code)
    , context_(std::move(context)) {
}

} // namespace core
} // namespace sandcastle
