#include "mui/event_pump.hpp"
#include "mui/platform.hpp"
#include "log.hpp"

namespace mui {

namespace {

std::optional<MouseButton> mouseButtonFromSdl(u8 button) {
    switch (button) {
    case SDL_BUTTON_LEFT: return MouseButton::Left;
    case SDL_BUTTON_MIDDLE: return MouseButton::Middle;
    case SDL_BUTTON_RIGHT: return MouseButton::Right;
    case SDL_BUTTON_X1: return MouseButton::X1;
    case SDL_BUTTON_X2: return MouseButton::X2;
    default: return std::nullopt;
    }
}

JoystickHat hatFromSdl(u8 value) {
    switch (value) {
    case SDL_HAT_UP: return JoystickHat::Up;
    case SDL_HAT_RIGHT: return JoystickHat::Right;
    case SDL_HAT_DOWN: return JoystickHat::Down;
    case SDL_HAT_LEFT: return JoystickHat::Left;
    case SDL_HAT_RIGHTUP: return JoystickHat::RightUp;
    case SDL_HAT_RIGHTDOWN: return JoystickHat::RightDown;
    case SDL_HAT_LEFTUP: return JoystickHat::LeftUp;
    case SDL_HAT_LEFTDOWN: return JoystickHat::LeftDown;
    default: return JoystickHat::Centered;
    }
}

JoystickPowerLevel powerFromSdl(SDL_JoystickPowerLevel level) {
    switch (level) {
    case SDL_JOYSTICK_POWER_EMPTY: return JoystickPowerLevel::Empty;
    case SDL_JOYSTICK_POWER_LOW: return JoystickPowerLevel::Low;
    case SDL_JOYSTICK_POWER_MEDIUM: return JoystickPowerLevel::Medium;
    case SDL_JOYSTICK_POWER_FULL: return JoystickPowerLevel::Full;
    case SDL_JOYSTICK_POWER_WIRED: return JoystickPowerLevel::Wired;
    case SDL_JOYSTICK_POWER_MAX: return JoystickPowerLevel::Max;
    default: return JoystickPowerLevel::Unknown;
    }
}

std::optional<GamepadAxis> gamepadAxisFromSdl(u8 axis) {
    switch (axis) {
    case SDL_CONTROLLER_AXIS_LEFTX: return GamepadAxis::LeftX;
    case SDL_CONTROLLER_AXIS_LEFTY: return GamepadAxis::LeftY;
    case SDL_CONTROLLER_AXIS_RIGHTX: return GamepadAxis::RightX;
    case SDL_CONTROLLER_AXIS_RIGHTY: return GamepadAxis::RightY;
    case SDL_CONTROLLER_AXIS_TRIGGERLEFT: return GamepadAxis::TriggerLeft;
    case SDL_CONTROLLER_AXIS_TRIGGERRIGHT: return GamepadAxis::TriggerRight;
    default: return std::nullopt;
    }
}

std::optional<GamepadButton> gamepadButtonFromSdl(u8 button) {
    switch (button) {
    case SDL_CONTROLLER_BUTTON_A: return GamepadButton::A;
    case SDL_CONTROLLER_BUTTON_B: return GamepadButton::B;
    case SDL_CONTROLLER_BUTTON_X: return GamepadButton::X;
    case SDL_CONTROLLER_BUTTON_Y: return GamepadButton::Y;
    case SDL_CONTROLLER_BUTTON_BACK: return GamepadButton::Back;
    case SDL_CONTROLLER_BUTTON_GUIDE: return GamepadButton::Guide;
    case SDL_CONTROLLER_BUTTON_START: return GamepadButton::Start;
    case SDL_CONTROLLER_BUTTON_LEFTSTICK: return GamepadButton::LeftStick;
    case SDL_CONTROLLER_BUTTON_RIGHTSTICK: return GamepadButton::RightStick;
    case SDL_CONTROLLER_BUTTON_LEFTSHOULDER: return GamepadButton::LeftShoulder;
    case SDL_CONTROLLER_BUTTON_RIGHTSHOULDER: return GamepadButton::RightShoulder;
    case SDL_CONTROLLER_BUTTON_DPAD_UP: return GamepadButton::DPadUp;
    case SDL_CONTROLLER_BUTTON_DPAD_DOWN: return GamepadButton::DPadDown;
    case SDL_CONTROLLER_BUTTON_DPAD_LEFT: return GamepadButton::DPadLeft;
    case SDL_CONTROLLER_BUTTON_DPAD_RIGHT: return GamepadButton::DPadRight;
    case SDL_CONTROLLER_BUTTON_MISC1: return GamepadButton::Misc1;
    case SDL_CONTROLLER_BUTTON_PADDLE1: return GamepadButton::Paddle1;
    case SDL_CONTROLLER_BUTTON_PADDLE2: return GamepadButton::Paddle2;
    case SDL_CONTROLLER_BUTTON_PADDLE3: return GamepadButton::Paddle3;
    case SDL_CONTROLLER_BUTTON_PADDLE4: return GamepadButton::Paddle4;
    case SDL_CONTROLLER_BUTTON_TOUCHPAD: return GamepadButton::Touchpad;
    default: return std::nullopt;
    }
}

Rect rectFromSdl(const SDL_Rect& r) { return {r.x, r.y, r.w, r.h}; }

Event withSize(Event::Type type, i32 w, i32 h) {
    Event e = Event::Make(type);
    e.data.size.w = w;
    e.data.size.h = h;
    return e;
}

Event withTouchpad(Event::Type type, const SDL_ControllerTouchpadEvent& ev) {
    Event e = Event::Make(type);
    e.which = u32(ev.which);
    e.data.touchpad.touchpad = ev.touchpad;
    e.data.touchpad.finger = ev.finger;
    e.data.touchpad.x = ev.x;
    e.data.touchpad.y = ev.y;
    e.data.touchpad.pressure = ev.pressure;
    return e;
}

Event withDisplay(Event::Type type, i32 index) {
    Event e = Event::Make(type);
    e.data.display = DisplayHandle{index};
    return e;
}

Result<Rect> displayBounds(i32 index, bool usable) {
    SDL_Rect r;
    int rc = usable ? SDL_GetDisplayUsableBounds(index, &r) : SDL_GetDisplayBounds(index, &r);
    if (rc != 0) return Result<Rect>::Fail(ErrorCode::PlatformInitFailed, SDL_GetError());
    return Result<Rect>::Ok(rectFromSdl(r));
}

} // namespace

Result<DisplayInfo> queryDisplay(i32 index) {
    const char* name = SDL_GetDisplayName(index);
    if (!name) return Result<DisplayInfo>::Fail(ErrorCode::PlatformInitFailed, SDL_GetError());

    DisplayInfo info;
    info.name = name;

    auto bounds = displayBounds(index, false);
    if (!bounds) return Result<DisplayInfo>::Fail(bounds.error());
    info.bounds = bounds.value();

    auto usable = displayBounds(index, true);
    if (!usable) return Result<DisplayInfo>::Fail(usable.error());
    info.usableBounds = usable.value();

    int count = SDL_GetNumDisplayModes(index);
    if (count < 0) return Result<DisplayInfo>::Fail(ErrorCode::PlatformInitFailed, SDL_GetError());
    for (int i = 0; i < count; ++i) {
        SDL_DisplayMode mode;
        if (SDL_GetDisplayMode(index, i, &mode) != 0) {
            return Result<DisplayInfo>::Fail(ErrorCode::PlatformInitFailed, SDL_GetError());
        }
        info.fullscreenModes.push_back({mode.w, mode.h, mode.refresh_rate, mode.format});
    }

    // SDL2 exposes no HDR state.
    info.hdrEnabled = false;
    return Result<DisplayInfo>::Ok(std::move(info));
}

// --- EventTranslator ---

void EventTranslator::refreshDisplays() {
    displays_.clear();
    int count = SDL_GetNumVideoDisplays();
    for (int i = 0; i < count; ++i) {
        auto info = queryDisplay(i);
        if (info) {
            displays_[i] = info.take();
        } else {
            logMessage("SDL", "display %d skipped: %s", i, info.error().message.c_str());
        }
    }
}

const DisplayInfo* EventTranslator::display(DisplayHandle handle) const {
    auto it = displays_.find(handle.index);
    return it == displays_.end() ? nullptr : &it->second;
}

std::optional<Event> EventTranslator::translateWindow(const SDL_WindowEvent& ev) const {
    using T = Event::Type;
    switch (ev.event) {
    case SDL_WINDOWEVENT_SHOWN: return Event::Make(T::WindowShown);
    case SDL_WINDOWEVENT_HIDDEN: return Event::Make(T::WindowHidden);
    case SDL_WINDOWEVENT_EXPOSED: return Event::Make(T::WindowExposed);
    case SDL_WINDOWEVENT_MOVED: {
        Event e = Event::Make(T::WindowMoved);
        e.data.position.x = ev.data1;
        e.data.position.y = ev.data2;
        return e;
    }
    case SDL_WINDOWEVENT_RESIZED: return withSize(T::WindowResized, ev.data1, ev.data2);
    case SDL_WINDOWEVENT_SIZE_CHANGED: {
        // The native payload is in logical units; HiDPI drawables are larger.
        int w = ev.data1, h = ev.data2;
        if (SDL_Window* window = SDL_GetWindowFromID(ev.windowID)) SDL_GL_GetDrawableSize(window, &w, &h);
        return withSize(T::WindowPixelSizeChanged, w, h);
    }
    case SDL_WINDOWEVENT_MINIMIZED: return Event::Make(T::WindowMinimized);
    case SDL_WINDOWEVENT_MAXIMIZED: return Event::Make(T::WindowMaximized);
    case SDL_WINDOWEVENT_RESTORED: return Event::Make(T::WindowRestored);
    case SDL_WINDOWEVENT_ENTER: return Event::Make(T::WindowMouseEnter);
    case SDL_WINDOWEVENT_LEAVE: return Event::Make(T::WindowMouseLeave);
    case SDL_WINDOWEVENT_FOCUS_GAINED: return Event::Make(T::WindowFocusGained);
    case SDL_WINDOWEVENT_FOCUS_LOST: return Event::Make(T::WindowFocusLost);
    case SDL_WINDOWEVENT_CLOSE: return Event::Make(T::WindowCloseRequested);
    case SDL_WINDOWEVENT_TAKE_FOCUS: return Event::Make(T::WindowTakeFocus);
    case SDL_WINDOWEVENT_HIT_TEST: return Event::Make(T::WindowHitTest);
    case SDL_WINDOWEVENT_ICCPROF_CHANGED: return Event::Make(T::WindowIccProfileChanged);
    case SDL_WINDOWEVENT_DISPLAY_CHANGED: {
        Event e = Event::Make(T::WindowDisplayChanged);
        e.data.displayIndex = ev.data1;
        return e;
    }
    default: return std::nullopt;
    }
}

std::optional<Event> EventTranslator::translateDisplay(const SDL_DisplayEvent& ev) {
    const i32 index = i32(ev.display);
    switch (ev.event) {
    case SDL_DISPLAYEVENT_CONNECTED: {
        auto info = queryDisplay(index);
        if (info) {
            displays_[index] = info.take();
        } else {
            logMessage("SDL", "display %d connected but not queryable: %s", index,
                    info.error().message.c_str());
        }
        return withDisplay(Event::Type::DisplayAdded, index);
    }
    case SDL_DISPLAYEVENT_DISCONNECTED:
        // SDL renumbers the remaining displays, so every record is rebuilt.
        displays_.erase(index);
        refreshDisplays();
        return withDisplay(Event::Type::DisplayRemoved, index);
    case SDL_DISPLAYEVENT_MOVED: {
        auto it = displays_.find(index);
        if (it != displays_.end()) {
            auto bounds = displayBounds(index, false);
            auto usable = displayBounds(index, true);
            if (bounds && usable) {
                it->second.bounds = bounds.value();
                it->second.usableBounds = usable.value();
            } else {
                logMessage("SDL", "display %d moved but bounds unavailable", index);
            }
        }
        return withDisplay(Event::Type::DisplayMoved, index);
    }
    default:
        return std::nullopt;
    }
}

std::optional<Event> EventTranslator::translate(const SDL_Event& native) {
    using T = Event::Type;
    switch (native.type) {
    case SDL_QUIT:
        return Event::Make(T::Quit);
    case SDL_WINDOWEVENT:
        // Only one window exists, so the window id is ignored.
        return translateWindow(native.window);
    case SDL_DISPLAYEVENT:
        return translateDisplay(native.display);

    case SDL_KEYDOWN:
    case SDL_KEYUP: {
        const SDL_Scancode scancode = native.key.keysym.scancode;
        const bool repeat = native.key.repeat != 0;
        if (repeat && scancode == SDL_SCANCODE_UNKNOWN) return std::nullopt;
        auto key = keyboardKeyFromScancode(i32(scancode));
        if (!key) return std::nullopt;
        Event e = Event::Make(native.type == SDL_KEYDOWN ? T::KeyboardKeyDown : T::KeyboardKeyUp);
        e.data.key.key = *key;
        e.data.key.repeat = repeat;
        return e;
    }
    case SDL_TEXTEDITING: {
        Event e = Event::Make(T::TextEditing);
        e.text = native.edit.text;
        e.data.editing.start = native.edit.start;
        e.data.editing.length = native.edit.length;
        return e;
    }
    case SDL_TEXTINPUT: {
        Event e = Event::Make(T::TextInput);
        e.text = native.text.text;
        return e;
    }
    case SDL_KEYMAPCHANGED:
        return Event::Make(T::KeymapChanged);

    case SDL_MOUSEMOTION: {
        Event e = Event::Make(T::MouseMotion);
        e.which = native.motion.which;
        e.data.motion.x = f32(native.motion.xrel);
        e.data.motion.y = f32(native.motion.yrel);
        return e;
    }
    case SDL_MOUSEBUTTONDOWN:
    case SDL_MOUSEBUTTONUP: {
        auto button = mouseButtonFromSdl(native.button.button);
        if (!button) return std::nullopt;
        Event e = Event::Make(native.type == SDL_MOUSEBUTTONDOWN ? T::MouseButtonDown : T::MouseButtonUp);
        e.which = native.button.which;
        e.data.mouseButton = *button;
        return e;
    }
    case SDL_MOUSEWHEEL: {
        // Inverted so that positive y points down, matching window coordinates.
        Event e = Event::Make(T::MouseWheel);
        e.which = native.wheel.which;
        e.data.motion.x = native.wheel.preciseX;
        e.data.motion.y = -native.wheel.preciseY;
        return e;
    }

    case SDL_JOYAXISMOTION: {
        Event e = Event::Make(T::JoystickAxisMotion);
        e.which = u32(native.jaxis.which);
        e.data.joyAxis.axis = native.jaxis.axis;
        e.data.joyAxis.value = native.jaxis.value;
        return e;
    }
    case SDL_JOYBALLMOTION: {
        Event e = Event::Make(T::JoystickBallMotion);
        e.which = u32(native.jball.which);
        e.data.joyBall.ball = native.jball.ball;
        e.data.joyBall.xrel = native.jball.xrel;
        e.data.joyBall.yrel = native.jball.yrel;
        return e;
    }
    case SDL_JOYHATMOTION: {
        Event e = Event::Make(T::JoystickHatMotion);
        e.which = u32(native.jhat.which);
        e.data.joyHat.hat = native.jhat.hat;
        e.data.joyHat.value = hatFromSdl(native.jhat.value);
        return e;
    }
    case SDL_JOYBUTTONDOWN:
    case SDL_JOYBUTTONUP: {
        Event e = Event::Make(native.type == SDL_JOYBUTTONDOWN ? T::JoystickButtonDown : T::JoystickButtonUp);
        e.which = u32(native.jbutton.which);
        e.data.joyButton = native.jbutton.button;
        return e;
    }
    case SDL_JOYDEVICEADDED:
    case SDL_JOYDEVICEREMOVED: {
        // For added devices SDL reports the device index, for removed ones the instance id.
        Event e = Event::Make(native.type == SDL_JOYDEVICEADDED ? T::JoystickAdded : T::JoystickRemoved);
        e.which = u32(native.jdevice.which);
        return e;
    }
    case SDL_JOYBATTERYUPDATED: {
        Event e = Event::Make(T::JoystickBatteryUpdated);
        e.which = u32(native.jbattery.which);
        e.data.battery = powerFromSdl(native.jbattery.level);
        return e;
    }

    case SDL_CONTROLLERAXISMOTION: {
        auto axis = gamepadAxisFromSdl(native.caxis.axis);
        if (!axis) return std::nullopt;
        Event e = Event::Make(T::GamepadAxisMotion);
        e.which = u32(native.caxis.which);
        e.data.padAxis.axis = *axis;
        e.data.padAxis.value = native.caxis.value;
        return e;
    }
    case SDL_CONTROLLERBUTTONDOWN:
    case SDL_CONTROLLERBUTTONUP: {
        auto button = gamepadButtonFromSdl(native.cbutton.button);
        if (!button) return std::nullopt;
        Event e = Event::Make(native.type == SDL_CONTROLLERBUTTONDOWN ? T::GamepadButtonDown
                                                                      : T::GamepadButtonUp);
        e.which = u32(native.cbutton.which);
        e.data.padButton = *button;
        return e;
    }
    case SDL_CONTROLLERDEVICEADDED:
    case SDL_CONTROLLERDEVICEREMOVED:
    case SDL_CONTROLLERDEVICEREMAPPED: {
        Event e = Event::Make(native.type == SDL_CONTROLLERDEVICEADDED   ? T::GamepadAdded
                              : native.type == SDL_CONTROLLERDEVICEREMOVED ? T::GamepadRemoved
                                                                           : T::GamepadRemapped);
        e.which = u32(native.cdevice.which);
        return e;
    }
    case SDL_CONTROLLERTOUCHPADDOWN:
        return withTouchpad(T::GamepadTouchpadDown, native.ctouchpad);
    case SDL_CONTROLLERTOUCHPADMOTION:
        return withTouchpad(T::GamepadTouchpadMotion, native.ctouchpad);
    case SDL_CONTROLLERTOUCHPADUP:
        return withTouchpad(T::GamepadTouchpadUp, native.ctouchpad);

    case SDL_DROPBEGIN:
        return Event::Make(T::DropBegin);
    case SDL_DROPFILE:
    case SDL_DROPTEXT: {
        Event e = Event::Make(native.type == SDL_DROPFILE ? T::DropFile : T::DropText);
        if (native.drop.file) e.text = native.drop.file;
        return e;
    }
    case SDL_DROPCOMPLETE:
        return Event::Make(T::DropComplete);

    case SDL_RENDER_TARGETS_RESET:
        return Event::Make(T::RenderTargetsReset);
    case SDL_RENDER_DEVICE_RESET:
        return Event::Make(T::RenderDeviceReset);

    default:
        return std::nullopt;
    }
}

// --- EventPump ---

EventPump::EventPump(const Platform&) {
    translator_.refreshDisplays();
}

std::vector<Event> EventPump::poll() {
    SDL_PumpEvents();
    std::vector<Event> events;
    SDL_Event native;
    while (SDL_PollEvent(&native)) {
        if (auto e = translator_.translate(native)) events.push_back(std::move(*e));
        // SDL hands ownership of drop payloads to the application.
        if ((native.type == SDL_DROPFILE || native.type == SDL_DROPTEXT) && native.drop.file) {
            SDL_free(native.drop.file);
        }
    }
    return events;
}

} // namespace mui
