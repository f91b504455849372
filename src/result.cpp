#include "mui/result.hpp"

namespace mui {

const char* errorCodeName(ErrorCode code) {
    switch (code) {
    case ErrorCode::PlatformInitFailed: return "PlatformInitFailed";
    case ErrorCode::WindowCreationFailed: return "WindowCreationFailed";
    case ErrorCode::ContextCreationFailed: return "ContextCreationFailed";
    case ErrorCode::DriverUnsupported: return "DriverUnsupported";
    case ErrorCode::MissingRequiredExtension: return "MissingRequiredExtension";
    case ErrorCode::VersionStringUnparseable: return "VersionStringUnparseable";
    case ErrorCode::ShaderCompileFailed: return "ShaderCompileFailed";
    case ErrorCode::ResourceDecodeFailed: return "ResourceDecodeFailed";
    }
    return "Unknown";
}

} // namespace mui
