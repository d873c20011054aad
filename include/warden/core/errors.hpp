/**
 * @file errors.hpp
 * @brief Typed failures raised by the sandbox lifecycle manager and backends
 *
 * Every failure that crosses a component boundary is a SandboxError carrying
 * an ErrorKind. Callers switch on the kind; the message is for humans.
 *
 * @date 2025
 */

#pragma once

#include <stdexcept>
#include <string>

namespace warden {
namespace core {

/**
 * @enum ErrorKind
 * @brief Failure categories surfaced by manager operations
 */
enum class ErrorKind {
    INVALID_INPUT,        ///< Missing or malformed required field
    NOT_FOUND,            ///< Unknown sandbox id
    ALREADY_RUNNING,      ///< start() on a Running sandbox
    LAUNCH_FAILURE,       ///< Backend could not create the isolated process
    TERMINATION_FAILURE   ///< Backend could not signal/kill a handle
};

/**
 * @brief Stable lowercase name of an error kind ("not-found", ...)
 */
std::string ErrorKindToString(ErrorKind kind);

/**
 * @class SandboxError
 * @brief Exception type for all typed sandbox failures
 *
 * InvalidInput, NotFound and AlreadyRunning propagate to the caller of the
 * triggering operation. LaunchFailure and TerminationFailure are thrown by
 * backends and absorbed by the manager into the sandbox's own state.
 */
class SandboxError : public std::runtime_error {
public:
    SandboxError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message)
        , kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace core
} // namespace warden
