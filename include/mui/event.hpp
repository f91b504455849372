#pragma once

/**
 * @file event.hpp
 * @brief Platform-neutral input and window events.
 */

#include "mui/keyboard.hpp"
#include "mui/types.hpp"
#include <string>
#include <vector>

namespace mui {

enum class MouseButton : u8 { Left, Middle, Right, X1, X2 };

/// @brief Joystick hat position. Diagonals are reported as their own values.
enum class JoystickHat : u8 {
    Centered, Up, Right, Down, Left, RightUp, RightDown, LeftUp, LeftDown,
};

enum class JoystickPowerLevel : u8 { Unknown, Empty, Low, Medium, Full, Wired, Max };

enum class GamepadAxis : u8 { LeftX, LeftY, RightX, RightY, TriggerLeft, TriggerRight };

/// @brief Gamepad buttons, face buttons named by their Xbox layout position.
enum class GamepadButton : u8 {
    A, B, X, Y,
    Back, Guide, Start,
    LeftStick, RightStick,
    LeftShoulder, RightShoulder,
    DPadUp, DPadDown, DPadLeft, DPadRight,
    Misc1,
    Paddle1, Paddle2, Paddle3, Paddle4,
    Touchpad,
};

/// @brief Opaque reference to a connected display. Valid while the display is connected.
struct DisplayHandle {
    i32 index;
};

inline bool operator==(DisplayHandle a, DisplayHandle b) { return a.index == b.index; }

struct DisplayMode {
    i32 width = 0;
    i32 height = 0;
    i32 refreshRate = 0;  ///< Hz, 0 when unknown.
    u32 pixelFormat = 0;  ///< SDL_PixelFormatEnum value.
};

/// @brief Snapshot of a display's properties, taken when it was connected or moved.
struct DisplayInfo {
    std::string name;
    Rect bounds;
    Rect usableBounds;
    std::vector<DisplayMode> fullscreenModes;
    bool hdrEnabled = false;
};

/**
 * Event - a single translated platform event.
 *
 * Tagged by type; the payload fields that apply to the type are listed next
 * to each enumerator. Text payloads (typed text, dropped file paths) live in
 * `text`, everything else in the `data` union.
 *
 * `which` carries the mouse, joystick or gamepad instance id for device events.
 */
struct Event {
    enum class Type : u8 {
        // window (data.size / data.position)
        WindowShown,
        WindowHidden,
        WindowExposed,
        WindowMoved,             ///< data.position
        WindowResized,           ///< data.size, logical units
        WindowPixelSizeChanged,  ///< data.size, drawable pixels (logical size when the window is unknown)
        WindowMinimized,
        WindowMaximized,
        WindowRestored,
        WindowMouseEnter,
        WindowMouseLeave,
        WindowFocusGained,
        WindowFocusLost,
        WindowCloseRequested,
        WindowTakeFocus,
        WindowHitTest,
        WindowIccProfileChanged,
        WindowDisplayChanged,    ///< data.displayIndex
        // keyboard
        KeyboardKeyDown,         ///< data.key
        KeyboardKeyUp,           ///< data.key
        TextEditing,             ///< text, data.editing
        TextInput,               ///< text
        KeymapChanged,
        // mouse
        MouseMotion,             ///< data.motion (relative)
        MouseButtonDown,         ///< data.mouseButton
        MouseButtonUp,           ///< data.mouseButton
        MouseWheel,              ///< data.motion (positive y scrolls down)
        // joystick
        JoystickAxisMotion,      ///< data.joyAxis
        JoystickBallMotion,      ///< data.joyBall
        JoystickHatMotion,       ///< data.joyHat
        JoystickButtonDown,      ///< data.joyButton
        JoystickButtonUp,        ///< data.joyButton
        JoystickAdded,
        JoystickRemoved,
        JoystickBatteryUpdated,  ///< data.battery
        // gamepad
        GamepadAxisMotion,       ///< data.padAxis
        GamepadButtonDown,       ///< data.padButton
        GamepadButtonUp,         ///< data.padButton
        GamepadAdded,
        GamepadRemoved,
        GamepadRemapped,
        GamepadTouchpadDown,     ///< data.touchpad
        GamepadTouchpadMotion,   ///< data.touchpad
        GamepadTouchpadUp,       ///< data.touchpad
        // drag and drop
        DropBegin,
        DropFile,                ///< text holds the path
        DropText,                ///< text
        DropComplete,
        // render
        RenderTargetsReset,
        RenderDeviceReset,
        // display
        DisplayAdded,            ///< data.display
        DisplayRemoved,          ///< data.display
        DisplayMoved,            ///< data.display
        // application
        Quit,
    };

    union Data {
        struct { i32 w, h; } size;
        struct { i32 x, y; } position;
        struct { KeyboardKey key; bool repeat; } key;
        struct { i32 start, length; } editing;
        struct { f32 x, y; } motion;
        MouseButton mouseButton;
        struct { u8 axis; i16 value; } joyAxis;
        struct { u8 ball; i16 xrel, yrel; } joyBall;
        struct { u8 hat; JoystickHat value; } joyHat;
        u8 joyButton;
        JoystickPowerLevel battery;
        struct { GamepadAxis axis; i16 value; } padAxis;
        GamepadButton padButton;
        struct { i32 touchpad, finger; f32 x, y, pressure; } touchpad;
        DisplayHandle display;
        i32 displayIndex;
    };

    Type type = Type::Quit;
    u32 which = 0;
    Data data{};
    std::string text;

    static Event Make(Type type) {
        Event e;
        e.type = type;
        return e;
    }
};

const char* eventTypeName(Event::Type type);

} // namespace mui
