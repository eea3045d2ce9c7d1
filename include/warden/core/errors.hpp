/**
 * @file errors.hpp
 * @brief Exception hierarchy for contract violations
 *
 * Expected request outcomes travel inside ValidationResult / ExecutionResult.
 * Exceptions are reserved for configuration errors, exhausted resources the
 * caller must handle, and audit tampering.
 *
 * @date 2025
 */

#pragma once

#include "warden/core/types.hpp"

#include <stdexcept>
#include <string>

namespace warden {
namespace core {

/**
 * @class SecurityError
 * @brief Base class for errors that map onto the violation taxonomy
 */
class SecurityError : public std::runtime_error {
public:
    SecurityError(ViolationKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ViolationKind Kind() const { return kind_; }

private:
    ViolationKind kind_;
};

/// Backend failed to create an isolated environment
class SandboxCreationError : public SecurityError {
public:
    explicit SandboxCreationError(const std::string& message)
        : SecurityError(ViolationKind::SANDBOX_CREATION_FAILED, message) {}
};

/// No lease became available before the deadline
class PoolExhaustedError : public SecurityError {
public:
    explicit PoolExhaustedError(const std::string& message)
        : SecurityError(ViolationKind::POOL_EXHAUSTED, message) {}
};

/// Request deadline passed while its sandbox was still being created
class DeadlineExceededError : public SecurityError {
public:
    explicit DeadlineExceededError(const std::string& message)
        : SecurityError(ViolationKind::TIMEOUT_EXCEEDED, message) {}
};

/// Invalid policy document (overlapping lists, malformed ranges, bad values)
class PolicyError : public std::runtime_error {
public:
    explicit PolicyError(const std::string& message)
        : std::runtime_error(message) {}
};

/// Audit record signature or chain does not verify
class IntegrityError : public std::runtime_error {
public:
    explicit IntegrityError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace core
} // namespace warden
