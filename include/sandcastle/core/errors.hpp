/**
 * @file errors.hpp
 * @brief Error taxonomy shared by the store, lifecycle, task and execution layers
 *
 * Every failure the engine surfaces carries an ErrorCode and a small structured
 * context (sandbox id, task id, operation kind). Runtime internals such as raw
 * docker stderr are logged, not exposed through the context.
 *
 * @date 2025
 */

#pragma once

#include <stdexcept>
#include <string>

namespace sandcastle {
namespace core {

/**
 * @enum ErrorCode
 * @brief Closed set of failure categories
 */
enum class ErrorCode {
    NOT_FOUND,            ///< Unknown sandbox, task or path
    CONFLICT,             ///< Name already held by a live sandbox
    QUOTA_EXCEEDED,       ///< Sandbox count, pending tasks or disk budget exhausted
    SANDBOX_NOT_ACTIVE,   ///< Sandbox exists but does not accept work
    RUNTIME_UNAVAILABLE,  ///< Container runtime unreachable after retries
    EXECUTION_TIMEOUT,    ///< Work exceeded its deadline
    PARTIAL_FAILURE,      ///< Some items of a batch failed (carried in results)
    PATH_CONFLICT,        ///< Path resolves outside the sandbox working area
    CREATION_ERROR,       ///< Container could not be created
    CONTAINER_GONE,       ///< Backing container disappeared
    CANCELLED,            ///< Work was cancelled
    INVALID_ARGUMENT,     ///< Malformed request or configuration
    INTERNAL              ///< Unexpected failure
};

/**
 * @brief Stable lowercase name of an error code ("not_found", ...)
 */
const char* ErrorCodeToString(ErrorCode code);

/**
 * @struct ErrorContext
 * @brief Identifiers attached to an error
 */
struct ErrorContext {
    std::string sandbox_id;  ///< Sandbox involved, if any
    std::string task_id;     ///< Task involved, if any
    std::string kind;        ///< Operation kind, if any
};

/**
 * @class SandboxException
 * @brief Exception thrown by every public engine entry point
 *
 * @code
 * try {
 *     lifecycle.CreateSandbox(request);
 * } catch (const SandboxException& e) {
 *     if (e.Code() == ErrorCode::QUOTA_EXCEEDED) { ... }
 * }
 * @endcode
 */
class SandboxException : public std::runtime_error {
public:
    SandboxException(ErrorCode code, const std::string& message, ErrorContext context = {});

    ErrorCode Code() const noexcept { return code_; }
    const ErrorContext& Context() const noexcept { return context_; }

private:
    ErrorCode code_;
    ErrorContext context_;
};

} // namespace core
} // namespace sandcastle
