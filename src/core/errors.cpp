/**
 * @file errors.cpp
 * @brief Error kind naming
 *
 * @date 2025
 */

#include "warden/core/errors.hpp"

namespace warden {
namespace core {

std::string ErrorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::INVALID_INPUT:       return "invalid-input";
        case ErrorKind::NOT_FOUND:           return "not-found";
        case ErrorKind::ALREADY_RUNNING:     return "already-running";
        case ErrorKind::LAUNCH_FAILURE:      return "launch-failure";
        case ErrorKind::TERMINATION_FAILURE: return "termination-failure";
    }
    return "unknown";
}

} // namespace core
} // namespace warden
