#pragma once
/**
 * @file error.h
 * @brief Result codes and exception types for FirestormSim
 *
 * Validation functions report a StormResult code. Engine entry points and
 * configuration loaders throw one of the exception types below so that a
 * caller can tell malformed input, mathematically degenerate input and
 * programming errors apart.
 */

#include "firestorm/core/types.h"
#include <stdexcept>
#include <string>

namespace firestorm {

// ============================================================================
// Storm Result Enum
// ============================================================================

/**
 * @brief Result codes for parsing, validation and simulation operations
 */
enum class StormResult : UInt8 {
    Success = 0,

    // Input validation errors
    ParseError,
    InvalidNumber,
    NegativeCount,
    EmptyHitboxSet,
    NonPositiveRadius,
    DuplicateHitboxRadius,
    NegativeIgnites,
    NonPositiveDuration,
    NonPositiveFrequency,
    InvalidTrialCount,
    InvalidCoverageSamples,
    ExcessiveProjectileCount,
    ExcessiveTrialCount,
    InvalidConfiguration,

    // Degenerate configuration errors
    DegenerateAreaModifier,
    DegenerateTrialCount
};

/**
 * @brief Convert StormResult to string
 */
inline const char* storm_result_to_string(StormResult result) {
    switch (result) {
        case StormResult::Success: return "Success";
        case StormResult::ParseError: return "ParseError";
        case StormResult::InvalidNumber: return "InvalidNumber";
        case StormResult::NegativeCount: return "NegativeCount";
        case StormResult::EmptyHitboxSet: return "EmptyHitboxSet";
        case StormResult::NonPositiveRadius: return "NonPositiveRadius";
        case StormResult::DuplicateHitboxRadius: return "DuplicateHitboxRadius";
        case StormResult::NegativeIgnites: return "NegativeIgnites";
        case StormResult::NonPositiveDuration: return "NonPositiveDuration";
        case StormResult::NonPositiveFrequency: return "NonPositiveFrequency";
        case StormResult::InvalidTrialCount: return "InvalidTrialCount";
        case StormResult::InvalidCoverageSamples: return "InvalidCoverageSamples";
        case StormResult::ExcessiveProjectileCount: return "ExcessiveProjectileCount";
        case StormResult::ExcessiveTrialCount: return "ExcessiveTrialCount";
        case StormResult::InvalidConfiguration: return "InvalidConfiguration";
        case StormResult::DegenerateAreaModifier: return "DegenerateAreaModifier";
        case StormResult::DegenerateTrialCount: return "DegenerateTrialCount";
        default: return "Unknown";
    }
}

/**
 * @brief True for codes describing a mathematically undefined configuration
 */
inline bool is_degenerate(StormResult result) {
    return result == StormResult::DegenerateAreaModifier ||
           result == StormResult::DegenerateTrialCount;
}

// ============================================================================
// Exceptions
// ============================================================================

/**
 * @brief Base class for user-facing FirestormSim errors
 */
class FirestormError : public std::runtime_error {
public:
    FirestormError(StormResult code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    StormResult code() const noexcept { return code_; }

private:
    StormResult code_;
};

/**
 * @brief Malformed or out-of-domain input (non-numeric fields, empty
 *        hitbox set, non-positive duration, ...)
 */
class InputValidationError : public FirestormError {
public:
    using FirestormError::FirestormError;
};

/**
 * @brief Mathematically undefined configuration (area modifier <= -1,
 *        fewer than two trials)
 */
class DegenerateConfigurationError : public FirestormError {
public:
    using FirestormError::FirestormError;
};

/**
 * @brief Broken internal invariant. Signals a programming error and is
 *        never meant to be caught by a front end.
 */
class InternalInvariantViolation : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

/**
 * @brief Throw the exception type matching a failed StormResult
 *
 * Does nothing for StormResult::Success.
 */
inline void throw_on_failure(StormResult result, const std::string& context) {
    if (result == StormResult::Success) {
        return;
    }
    std::string message = context + ": " + storm_result_to_string(result);
    if (is_degenerate(result)) {
        throw DegenerateConfigurationError(result, message);
    }
    throw InputValidationError(result, message);
}

} // namespace firestorm
