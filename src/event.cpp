#include "mui/event.hpp"

namespace mui {

const char* eventTypeName(Event::Type type) {
    switch (type) {
    case Event::Type::WindowShown: return "WindowShown";
    case Event::Type::WindowHidden: return "WindowHidden";
    case Event::Type::WindowExposed: return "WindowExposed";
    case Event::Type::WindowMoved: return "WindowMoved";
    case Event::Type::WindowResized: return "WindowResized";
    case Event::Type::WindowPixelSizeChanged: return "WindowPixelSizeChanged";
    case Event::Type::WindowMinimized: return "WindowMinimized";
    case Event::Type::WindowMaximized: return "WindowMaximized";
    case Event::Type::WindowRestored: return "WindowRestored";
    case Event::Type::WindowMouseEnter: return "WindowMouseEnter";
    case Event::Type::WindowMouseLeave: return "WindowMouseLeave";
    case Event::Type::WindowFocusGained: return "WindowFocusGained";
    case Event::Type::WindowFocusLost: return "WindowFocusLost";
    case Event::Type::WindowCloseRequested: return "WindowCloseRequested";
    case Event::Type::WindowTakeFocus: return "WindowTakeFocus";
    case Event::Type::WindowHitTest: return "WindowHitTest";
    case Event::Type::WindowIccProfileChanged: return "WindowIccProfileChanged";
    case Event::Type::WindowDisplayChanged: return "WindowDisplayChanged";
    case Event::Type::KeyboardKeyDown: return "KeyboardKeyDown";
    case Event::Type::KeyboardKeyUp: return "KeyboardKeyUp";
    case Event::Type::TextEditing: return "TextEditing";
    case Event::Type::TextInput: return "TextInput";
    case Event::Type::KeymapChanged: return "KeymapChanged";
    case Event::Type::MouseMotion: return "MouseMotion";
    case Event::Type::MouseButtonDown: return "MouseButtonDown";
    case Event::Type::MouseButtonUp: return "MouseButtonUp";
    case Event::Type::MouseWheel: return "MouseWheel";
    case Event::Type::JoystickAxisMotion: return "JoystickAxisMotion";
    case Event::Type::JoystickBallMotion: return "JoystickBallMotion";
    case Event::Type::JoystickHatMotion: return "JoystickHatMotion";
    case Event::Type::JoystickButtonDown: return "JoystickButtonDown";
    case Event::Type::JoystickButtonUp: return "JoystickButtonUp";
    case Event::Type::JoystickAdded: return "JoystickAdded";
    case Event::Type::JoystickRemoved: return "JoystickRemoved";
    case Event::Type::JoystickBatteryUpdated: return "JoystickBatteryUpdated";
    case Event::Type::GamepadAxisMotion: return "GamepadAxisMotion";
    case Event::Type::GamepadButtonDown: return "GamepadButtonDown";
    case Event::Type::GamepadButtonUp: return "GamepadButtonUp";
    case Event::Type::GamepadAdded: return "GamepadAdded";
    case Event::Type::GamepadRemoved: return "GamepadRemoved";
    case Event::Type::GamepadRemapped: return "GamepadRemapped";
    case Event::Type::GamepadTouchpadDown: return "GamepadTouchpadDown";
    case Event::Type::GamepadTouchpadMotion: return "GamepadTouchpadMotion";
    case Event::Type::GamepadTouchpadUp: return "GamepadTouchpadUp";
    case Event::Type::DropBegin: return "DropBegin";
    case Event::Type::DropFile: return "DropFile";
    case Event::Type::DropText: return "DropText";
    case Event::Type::DropComplete: return "DropComplete";
    case Event::Type::RenderTargetsReset: return "RenderTargetsReset";
    case Event::Type::RenderDeviceReset: return "RenderDeviceReset";
    case Event::Type::DisplayAdded: return "DisplayAdded";
    case Event::Type::DisplayRemoved: return "DisplayRemoved";
    case Event::Type::DisplayMoved: return "DisplayMoved";
    case Event::Type::Quit: return "Quit";
    }
    return "Unknown";
}

} // namespace mui
