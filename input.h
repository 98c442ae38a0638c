#pragma once

#include "types.h"

#include <string>
#include <vector>
#include <optional>
#include <limits>

namespace ember
{
    enum class MouseCursor
    {
        Default = ImGuiMouseCursor_Arrow,
        TextInput = ImGuiMouseCursor_TextInput,
        ResizeAll = ImGuiMouseCursor_ResizeAll,
        ResizeVertical = ImGuiMouseCursor_ResizeNS,
        ResizeHorizontal = ImGuiMouseCursor_ResizeEW,
        ResizeTopRight = ImGuiMouseCursor_ResizeNESW,
        ResizeTopLeft = ImGuiMouseCursor_ResizeNWSE,
        PointingHand = ImGuiMouseCursor_Hand,
        NotAllowed = ImGuiMouseCursor_NotAllowed,
        TotalCursors
    };

    enum Key : int16_t
    {
        Key_Invalid = -1,
        Key_Tab,
        Key_LeftArrow,
        Key_RightArrow,
        Key_UpArrow,
        Key_DownArrow,
        Key_PageUp,
        Key_PageDown,
        Key_Home,
        Key_End,
        Key_Insert,
        Key_Delete,
        Key_Backspace,
        Key_Enter,
        Key_Escape,
        Key_Ctrl,
        Key_Shift,
        Key_Alt,
        Key_Super,
        Key_Total
    };

    enum class EventType : int16_t
    {
        Copy, Cut, Text, Key
    };

    struct Event
    {
        EventType type = EventType::Text;
        std::string text; // Only for EventType::Text
        Key key = Key_Invalid;
        bool pressed = false;

        [[nodiscard]] static Event MakeText(std::string text) { return Event{ EventType::Text, std::move(text) }; }
        [[nodiscard]] static Event MakeKey(Key key, bool pressed) { return Event{ EventType::Key, {}, key, pressed }; }
        [[nodiscard]] static Event MakeCopy() { return Event{ EventType::Copy }; }
        [[nodiscard]] static Event MakeCut() { return Event{ EventType::Cut }; }
    };

    // What the platform captured since the last frame, in points
    struct RawInput
    {
        bool mouseDown = false;
        std::optional<ImVec2> mousePos;
        ImVec2 scrollDelta;
        ImVec2 screenSize;
        std::optional<float> pixelsPerPoint; // Defaults to 1 when the platform does not know
        double time = 0.0;                   // Monotonic, in seconds
        std::vector<Event> events;
    };

    struct MouseInput
    {
        bool down = false;
        bool pressed = false;      // Went down this frame
        bool released = false;     // Went up this frame
        bool couldBeClick = false; // Has not moved far since the press
        bool click = false;        // Released this frame, and still could be a click
        bool doubleClick = false;  // Clicked within EMBER_MAX_DOUBLE_CLICK_DELAY of the previous click
        double lastClickTime = std::numeric_limits<double>::lowest();

        std::optional<ImVec2> pos;
        std::optional<ImVec2> pressOrigin;
        ImVec2 delta;
        ImVec2 velocity; // Points per second

        [[nodiscard]] MouseInput BeginFrame(const RawInput& next, float dt) const;
    };

    struct InputState
    {
        RawInput raw;
        MouseInput mouse;
        ImVec2 scrollDelta;
        ImVec2 screenSize;
        float pixelsPerPoint = 1.f;
        double time = 0.0;
        float unstableDt = 0.f; // Raw time since the last frame, possibly nonsense
        float dt = EMBER_FALLBACK_FRAMETIME;
        std::vector<Event> events;

        [[nodiscard]] InputState BeginFrame(RawInput next) const;
    };

    // User visible side effects of a frame, reset at the end of every frame
    struct Output
    {
        MouseCursor cursor = MouseCursor::Default;
        std::string copiedText;
        std::string openUrl;
        bool needsRepaint = false;
    };
}
