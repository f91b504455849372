#pragma once

/**
 * @file result.hpp
 * @brief Error taxonomy and the value-or-error return type used by fallible operations.
 */

#include "mui/types.hpp"
#include <string>
#include <utility>

namespace mui {

/// @brief Why a fallible operation failed.
enum class ErrorCode : u8 {
    PlatformInitFailed,        ///< SDL subsystem initialization failed.
    WindowCreationFailed,      ///< The native window could not be created.
    ContextCreationFailed,     ///< No usable GL context could be created or made current.
    DriverUnsupported,         ///< GL version below 2.0.
    MissingRequiredExtension,  ///< GL 2.x without vertex array objects.
    VersionStringUnparseable,  ///< GL_VERSION did not start with "major.minor".
    ShaderCompileFailed,       ///< Compile or link failure, message holds the driver log.
    ResourceDecodeFailed,      ///< A file could not be read or decoded.
};

/// @brief Stable name of an error code, e.g. "DriverUnsupported".
const char* errorCodeName(ErrorCode code);

/// @brief True for failures caused by an inadequate GL driver.
inline bool isDriverError(ErrorCode code) {
    return code == ErrorCode::DriverUnsupported ||
           code == ErrorCode::MissingRequiredExtension ||
           code == ErrorCode::VersionStringUnparseable;
}

/// @brief An error code with a human-readable message.
struct Error {
    ErrorCode code = ErrorCode::PlatformInitFailed;
    std::string message;
};

/**
 * Value-or-error return type.
 *
 * Usage:
 *   auto window = Window::Make(platform);
 *   if (!window) { report(window.error()); return; }
 *   auto w = window.take();
 */
template <typename T>
class Result {
public:
    static Result Ok(T value) {
        Result r;
        r.ok_ = true;
        r.value_ = std::move(value);
        return r;
    }

    static Result Fail(ErrorCode code, std::string message) {
        Result r;
        r.error_.code = code;
        r.error_.message = std::move(message);
        return r;
    }

    static Result Fail(Error error) {
        Result r;
        r.error_ = std::move(error);
        return r;
    }

    bool ok() const { return ok_; }
    explicit operator bool() const { return ok_; }

    T& value() { return value_; }
    const T& value() const { return value_; }

    /// @brief Move the value out. The result keeps a moved-from value.
    T take() { return std::move(value_); }

    /// @brief The failure. Meaningless when ok().
    const Error& error() const { return error_; }

private:
    Result() = default;

    bool ok_ = false;
    T value_{};
    Error error_;
};

} // namespace mui
