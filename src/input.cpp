#include "input.h"

namespace ember
{
    MouseInput MouseInput::BeginFrame(const RawInput& next, float dt) const
    {
        MouseInput result;
        result.down = next.mouseDown;
        result.pressed = !down && next.mouseDown;
        result.released = down && !next.mouseDown;
        result.pos = next.mousePos;
        result.pressOrigin = pressOrigin;
        result.couldBeClick = couldBeClick;
        result.lastClickTime = lastClickTime;

        if (pos.has_value() && next.mousePos.has_value())
            result.delta = *next.mousePos - *pos;

        if (result.pressed)
        {
            result.pressOrigin = next.mousePos;
            result.couldBeClick = true;
        }
        else if (!down || !pos.has_value())
            result.pressOrigin = std::nullopt;

        if (result.pressOrigin.has_value() && next.mousePos.has_value())
            result.couldBeClick = result.couldBeClick &&
                Distance(*result.pressOrigin, *next.mousePos) < EMBER_MAX_CLICK_DIST;
        else if (!result.released)
            result.couldBeClick = false;

        if (result.released && result.couldBeClick)
        {
            result.click = true;
            result.doubleClick = (next.time - lastClickTime) < EMBER_MAX_DOUBLE_CLICK_DELAY;
            result.lastClickTime = next.time;
        }

        result.velocity = dt > 0.f ? result.delta / dt : ImVec2{};
        return result;
    }

    InputState InputState::BeginFrame(RawInput next) const
    {
        InputState result;
        result.unstableDt = (float)(next.time - time);
        result.dt = result.unstableDt > 0.f && result.unstableDt <= EMBER_MAX_FRAMETIME ?
            result.unstableDt : EMBER_FALLBACK_FRAMETIME;
        result.time = next.time;
        result.mouse = mouse.BeginFrame(next, result.dt);
        result.scrollDelta = next.scrollDelta;
        result.screenSize = next.screenSize;
        result.pixelsPerPoint = next.pixelsPerPoint.value_or(1.f);

        // A non-positive scale would divide by zero everywhere points are rounded to pixels
        if (result.pixelsPerPoint <= 0.f) result.pixelsPerPoint = 1.f;

        result.events = next.events;
        result.raw = std::move(next);
        return result;
    }
}
