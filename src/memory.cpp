#include "memory.h"

#include <algorithm>

namespace ember
{
    void Interaction::BeginFrame(const MouseInput& prev)
    {
        auto prevClickId = clickId, prevDragId = dragId;
        clickInterest = false;
        dragInterest = false;

        if (!prev.couldBeClick)
            clickId = std::nullopt;

        if (!prev.down || !prev.pos.has_value())
        {
            // Mouse was not down last frame, nothing can still be active
            clickId = std::nullopt;
            dragId = std::nullopt;
            dragIsWindow = false;
        }

        if ((prevClickId != clickId || prevDragId != dragId) && Config.logger != nullptr)
            Config.logger->OwnershipChanged(clickId, dragId);
    }

#pragma region Areas

    const AreaState* Areas::Get(Id id) const
    {
        auto it = _areas.find(id);
        return it != _areas.end() ? &it->second : nullptr;
    }

    bool Areas::IsVisible(Layer layer) const
    {
        return _visibleLastFrame.count(layer) != 0 || _visibleCurrentFrame.count(layer) != 0;
    }

    void Areas::SetState(Layer layer, AreaState state)
    {
        _visibleCurrentFrame.insert(layer);
        auto [it, inserted] = _areas.insert_or_assign(layer.id, state);
        if (inserted) _order.push_back(layer);
    }

    void Areas::MoveToTop(Layer layer)
    {
        _visibleCurrentFrame.insert(layer);
        _wantsToBeOnTop.insert(layer);

        if (std::find(_order.begin(), _order.end(), layer) == _order.end())
            _order.push_back(layer);
    }

    std::optional<Layer> Areas::LayerAt(ImVec2 pos, float tolerance) const
    {
        for (auto it = _order.rbegin(); it != _order.rend(); ++it)
        {
            if (!IsVisible(*it)) continue;

            auto state = Get(it->id);
            if (state != nullptr && state->interactable && ContainsInclusive(Expanded(state->Rect(), tolerance), pos))
                return *it;
        }

        return std::nullopt;
    }

    void Areas::EndFrame()
    {
        _visibleLastFrame = std::move(_visibleCurrentFrame);
        _visibleCurrentFrame.clear();

        // Stable, so areas keep their relative order within an Order unless raised this frame
        std::stable_sort(_order.begin(), _order.end(), [this](const Layer& lhs, const Layer& rhs) {
            auto ltop = _wantsToBeOnTop.count(lhs) != 0, rtop = _wantsToBeOnTop.count(rhs) != 0;
            return lhs.order != rhs.order ? lhs.order < rhs.order : (!ltop && rtop);
        });
        _wantsToBeOnTop.clear();
    }

#pragma endregion

    void Memory::BeginFrame(const InputState& prevInput)
    {
        interaction.BeginFrame(prevInput.mouse);

        if (!prevInput.mouse.down || !prevInput.mouse.pos.has_value())
            windowInteraction = std::nullopt;
    }

    void Memory::EndFrame()
    {
        areas.EndFrame();
    }

    std::optional<Layer> Memory::LayerAt(ImVec2 pos, float tolerance) const
    {
        return areas.LayerAt(pos, tolerance);
    }

    bool Memory::StartWindowInteraction(Layer area, WindowInteractionType type, const ImRect& startRect)
    {
        if (interaction.dragId.has_value() && interaction.dragId != area.id && !interaction.dragIsWindow)
            return false;

        interaction.dragId = area.id;
        interaction.dragIsWindow = true;
        windowInteraction = WindowInteraction{ area, type, startRect };
        areas.MoveToTop(area);

        if (Config.logger != nullptr)
            Config.logger->OwnershipChanged(interaction.clickId, interaction.dragId);
        return true;
    }

    void Memory::StopWindowInteraction()
    {
        windowInteraction = std::nullopt;
    }
}
