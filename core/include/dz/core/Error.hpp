/**
 * @file Error.hpp
 * @brief Structured error type with source location tracking.
 *
 * Error codes cover the failure classes the simulation can report:
 * structural misuse of the world, configuration problems detected at
 * engine start-up, and failures raised from inside a system's update.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef DZ_CORE_ERROR_HPP
    #define DZ_CORE_ERROR_HPP

    #include "Types.hpp"

    #include <expected>
    #include <source_location>
    #include <string>
    #include <string_view>

namespace dz::core {

/**
 * @brief Engine-wide error code enumeration.
 */
enum class ErrorCode : u16 {
    kNone = 0,

    kOutOfMemory,
    kInvalidArgument,
    kInvalidState,
    kNotFound,
    kAlreadyExists,
    kOutOfRange,
    kIoError,

    kEntityNotFound,
    kEntityInactive,
    kComponentMissing,

    kSystemFailed,

    kSerializationFailed,

    kNotImplemented,
    kInternalError,
};

/**
 * @brief Stable display name of an error code, used in log lines.
 */
[[nodiscard]] constexpr std::string_view errorCodeName(ErrorCode code)
{
    switch (code)
    {
    case ErrorCode::kNone:                return "None";
    case ErrorCode::kOutOfMemory:         return "OutOfMemory";
    case ErrorCode::kInvalidArgument:     return "InvalidArgument";
    case ErrorCode::kInvalidState:        return "InvalidState";
    case ErrorCode::kNotFound:            return "NotFound";
    case ErrorCode::kAlreadyExists:       return "AlreadyExists";
    case ErrorCode::kOutOfRange:          return "OutOfRange";
    case ErrorCode::kIoError:             return "IoError";
    case ErrorCode::kEntityNotFound:      return "EntityNotFound";
    case ErrorCode::kEntityInactive:      return "EntityInactive";
    case ErrorCode::kComponentMissing:    return "ComponentMissing";
    case ErrorCode::kSystemFailed:        return "SystemFailed";
    case ErrorCode::kSerializationFailed: return "SerializationFailed";
    case ErrorCode::kNotImplemented:      return "NotImplemented";
    case ErrorCode::kInternalError:       return "InternalError";
    }
    return "Unknown";
}

/**
 * @brief Structured error value carrying a code, message, and origin.
 *
 * Error is a lightweight value type intended to be stored inside
 * Expected<T>.
 */
class Error final {
public:
    /**
     * @brief Construct an error from a code and message.
     * @param code    Enumerated error code.
     * @param message Human-readable description.
     * @param loc     Source location (auto-filled by the compiler).
     */
    explicit Error(
        ErrorCode code,
        std::string message,
        std::source_location loc = std::source_location::current()
    ) : _code(code), _message(std::move(message)), _location(loc) {}

    [[nodiscard]] ErrorCode           code()     const { return _code; }
    [[nodiscard]] const std::string & message()  const { return _message; }
    [[nodiscard]] std::source_location location() const { return _location; }

private:
    ErrorCode            _code;
    std::string          _message;
    std::source_location _location;
};

/// @brief Convenience alias for std::unexpected<Error>.
using Unexpected = std::unexpected<Error>;

/// @brief Factory function to create an unexpected error.
/// @param code Error code.
/// @param message Human-readable description.
/// @param loc Source location (auto-filled).
/// @return std::unexpected<Error>.
[[nodiscard]] inline auto makeError(
    ErrorCode code,
    std::string message,
    std::source_location loc = std::source_location::current())
{
    return std::unexpected<Error>(Error{code, std::move(message), loc});
}

} // namespace dz::core

#endif // DZ_CORE_ERROR_HPP
