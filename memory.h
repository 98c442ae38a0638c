#pragma once

#include "types.h"
#include "input.h"

#include <vector>
#include <optional>
#include <unordered_map>
#include <unordered_set>

namespace ember
{
    // Which widget owns the pointer, carried over from frame to frame
    struct Interaction
    {
        std::optional<Id> clickId;
        std::optional<Id> dragId;
        bool dragIsWindow = false; // dragId belongs to a window move, any widget drag may take it over

        // Did any widget under the pointer sense these this frame
        bool clickInterest = false;
        bool dragInterest = false;

        void BeginFrame(const MouseInput& prev);
    };

    enum class WindowInteractionType
    {
        Drag, Resize
    };

    struct WindowInteraction
    {
        Layer area;
        WindowInteractionType type = WindowInteractionType::Drag;
        ImRect startRect;
    };

    struct AreaState
    {
        ImVec2 pos;
        ImVec2 size;
        bool interactable = true;
        ImVec2 vel;

        ImRect Rect() const { return RectFromMinSize(pos, size); }
    };

    // Registry of every area (window, popup, fullscreen ui) ever shown. Its order list is the
    // single source of z-order, for hit testing as well as for painting.
    struct Areas
    {
        size_t Count() const { return _areas.size(); }
        const AreaState* Get(Id id) const;
        const std::vector<Layer>& Order() const { return _order; }
        bool IsVisible(Layer layer) const;

        void SetState(Layer layer, AreaState state);
        void MoveToTop(Layer layer);
        [[nodiscard]] std::optional<Layer> LayerAt(ImVec2 pos, float tolerance) const;

        void EndFrame();

    private:

        std::unordered_map<Id, AreaState, IdHasher> _areas;
        std::vector<Layer> _order; // Back to front
        std::unordered_set<Layer, LayerHasher> _visibleLastFrame;
        std::unordered_set<Layer, LayerHasher> _visibleCurrentFrame;
        std::unordered_set<Layer, LayerHasher> _wantsToBeOnTop;
    };

    struct Memory
    {
        Interaction interaction;
        std::optional<WindowInteraction> windowInteraction;
        std::unordered_map<Id, bool, IdHasher> collapsingHeaders;
        Areas areas;

        void BeginFrame(const InputState& prevInput);
        void EndFrame();

        [[nodiscard]] std::optional<Layer> LayerAt(ImVec2 pos, float tolerance) const;

        // Begins moving or resizing an area through an ambient drag, which any widget drag preempts
        bool StartWindowInteraction(Layer area, WindowInteractionType type, const ImRect& startRect);
        void StopWindowInteraction();
    };
}
