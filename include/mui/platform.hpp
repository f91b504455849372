#pragma once

#include "mui/result.hpp"
#include <memory>

namespace mui {

/**
 * Platform - owns the SDL library lifetime.
 *
 * Initializes the video, events, joystick, gamepad and haptic subsystems and
 * shuts SDL down when destroyed. Exactly one Platform should exist at a time;
 * windows and event pumps take it by reference to prove SDL is initialized.
 */
class Platform {
public:
    static Result<std::unique_ptr<Platform>> Make();
    ~Platform();

    Platform(const Platform&) = delete;
    Platform& operator=(const Platform&) = delete;

    /// @brief Name of the active SDL video driver, e.g. "x11".
    const char* videoDriver() const;

private:
    Platform() = default;
};

} // namespace mui
