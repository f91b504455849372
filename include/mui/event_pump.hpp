#pragma once

/**
 * @file event_pump.hpp
 * @brief Translation of SDL events into mui events, and the per-frame event pump.
 */

#include "mui/event.hpp"
#include "mui/result.hpp"
#include <SDL2/SDL.h>
#include <optional>
#include <unordered_map>
#include <vector>

namespace mui {

class Platform;

/// @brief Query name, bounds and fullscreen modes of the display at index.
Result<DisplayInfo> queryDisplay(i32 index);

/**
 * EventTranslator - maps native SDL events onto Event.
 *
 * Keeps a record of every known display, keyed by SDL display index. Records
 * are added on DisplayAdded, refreshed on DisplayMoved and removed on
 * DisplayRemoved. A display whose properties cannot be queried still produces
 * its event; it simply has no record.
 *
 * Native events with no counterpart (and unknown keys or mouse buttons)
 * translate to nullopt.
 */
class EventTranslator {
public:
    std::optional<Event> translate(const SDL_Event& native);

    /// @brief Rebuild the display records from the displays SDL currently reports.
    void refreshDisplays();

    /// @brief Record for a display, or nullptr if unknown.
    const DisplayInfo* display(DisplayHandle handle) const;
    const std::unordered_map<i32, DisplayInfo>& displays() const { return displays_; }

private:
    std::optional<Event> translateWindow(const SDL_WindowEvent& ev) const;
    std::optional<Event> translateDisplay(const SDL_DisplayEvent& ev);

    std::unordered_map<i32, DisplayInfo> displays_;
};

/**
 * EventPump - drains SDL's queue once per frame.
 *
 * Usage:
 *   EventPump pump(*platform);
 *   for (const Event& e : pump.poll()) { ... }
 */
class EventPump {
public:
    /// Requires an initialized Platform; seeds the display table from SDL.
    explicit EventPump(const Platform& platform);

    /// @brief Pump the OS and return every translatable event, oldest first.
    std::vector<Event> poll();

    const EventTranslator& translator() const { return translator_; }
    const DisplayInfo* display(DisplayHandle handle) const { return translator_.display(handle); }

private:
    EventTranslator translator_;
};

} // namespace mui
