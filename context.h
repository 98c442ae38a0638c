// =====================================================================
//                    WHAT IS THIS FILE???
// =====================================================================
//
// Context is the root of all state of the UI. A new "generation" of it is created by every
// call to BeginFrame, copied from the previous one and then advanced with the new input.
// Widgets only ever see the current generation, through the Ui handle returned by BeginFrame.
//
// The input snapshot is immutable for the whole frame. Everything else which widgets mutate
// (memory, paint commands, output, ...) lives in its own independently lockable subsection.
// No function in here holds two of these locks at once, and locking the same subsection twice
// from the same call stack is a fatal error, not a deadlock.
//
// At EndFrame, the paint commands are drained in the z-order of the area registry (see Areas
// in memory.h), which is the same order used for hit-testing in Interact.

#pragma once

#include "types.h"
#include "input.h"
#include "paint.h"
#include "fonts.h"
#include "memory.h"
#include "style.h"

#include <memory>
#include <vector>
#include <optional>
#include <string_view>
#include <unordered_map>

namespace ember
{
    struct Ui;
    struct Context;

    // Number of times BeginFrame was called, across all contexts
    int64_t FramesBegun();

    // Starts a frame: derives the next generation of context from the current one plus the
    // new input, publishes it in place of context and returns a Ui covering the whole screen
    [[nodiscard]] Ui BeginFrame(std::shared_ptr<Context>& context, RawInput input);

    struct FrameOutput
    {
        Output output;
        std::vector<ClippedPaintCmd> primitives;
        PaintBatches batches; // Empty unless Config.tessellator is set
        PaintStats stats;
    };

    struct Context
    {
        Context() = default;
        Context(const Context& previous) = default;
        Context& operator=(const Context&) = delete;

        [[nodiscard]] static std::shared_ptr<Context> Create();

        [[nodiscard]] FrameOutput EndFrame();

#pragma region Accessors

        ImRect Rect() const;
        const InputState& GetInput() const { return _input; }

        // Not valid until the first call to BeginFrame, the scale factor is not known until then
        const Fonts& GetFonts() const;

        // Takes effect at the start of the next frame, pixelsPerPoint is taken from the input
        void SetFonts(FontDefinitions definitions);

        Style GetStyle() const { return _style.Get(); }
        void SetStyle(Style style) { _style.Set(std::move(style)); }
        PaintOptions GetPaintOptions() const { return _paintOptions.Get(); }
        void SetPaintOptions(PaintOptions options) { _paintOptions.Set(options); }
        PaintStats LastPaintStats() const { return _paintStats.Get(); }

        Mutex<Memory>::Guard GetMemory() { return _memory.Lock(); }
        Mutex<GraphicLayers>::Guard GetGraphics() { return _graphics.Lock(); }
        Mutex<Output>::Guard GetOutput() { return _output.Lock(); }

        // Forgets every area, ownership and collapsing header state
        void ResetMemory();

        float PixelsPerPoint() const { return _input.pixelsPerPoint; }
        float RoundToPixel(float point) const;
        ImVec2 RoundPosToPixels(ImVec2 pos) const;
        ImVec2 RoundVecToPixels(ImVec2 vec) const;
        ImRect RoundRectToPixels(const ImRect& rect) const;

#pragma endregion

#pragma region Ids

        // Ids are expected to be claimed at one position per frame, claiming one again further
        // than EMBER_ID_CLASH_TOLERANCE away paints a diagnostic at both positions
        Id RegisterUniqueId(Id id, std::string_view sourceName, ImVec2 pos);
        Id MakeUniqueId(std::string_view source, ImVec2 pos);
        Id MakeUniqueId(int64_t source, ImVec2 pos);

#pragma endregion

#pragma region Interaction

        [[nodiscard]] std::optional<Layer> LayerAt(ImVec2 pos);
        bool ContainsMouse(Layer layer, const ImRect& clipRect, const ImRect& rect);

        // Hit-tests rect and resolves click/drag ownership of id. Without an id or a sense this
        // is a pure hover query.
        InteractInfo Interact(Layer layer, const ImRect& clipRect, const ImRect& rect,
            std::optional<Id> id, int32_t sense);

#pragma endregion

#pragma region Painting

        void AddPaintCmd(Layer layer, PaintCmd cmd);

        void ShowError(ImVec2 pos, std::string_view text);
        void DebugText(ImVec2 pos, std::string_view text);
        void DebugRect(const ImRect& rect, uint32_t color, std::string_view name);

        // Shows text anywhere on screen, use (Center, Center) alignment to center it on pos
        ImRect FloatingText(Layer layer, ImVec2 pos, std::string_view text, TextStyle style,
            Align horizontal, Align vertical, std::optional<uint32_t> color = std::nullopt);
        void AddGalley(Layer layer, ImVec2 pos, Galley galley, TextStyle style,
            std::optional<uint32_t> color = std::nullopt);

#pragma endregion

    private:

        friend Ui BeginFrame(std::shared_ptr<Context>& context, RawInput input);

        void Advance(RawInput input);
        void Paint(FrameOutput& result);

        Mutex<Style> _style{ "style" };
        Mutex<PaintOptions> _paintOptions{ "paint options" };
        std::shared_ptr<const Fonts> _fonts; // Shared between generations until the definitions change
        Mutex<FontDefinitions> _fontDefinitions{ "font definitions" };
        Mutex<Memory> _memory{ "memory" };

        InputState _input;

        Mutex<GraphicLayers> _graphics{ "graphics" };
        Mutex<Output> _output{ "output" };
        Mutex<std::unordered_map<Id, ImVec2, IdHasher>> _usedIds{ "used ids" };
        Mutex<PaintStats> _paintStats{ "paint stats" };
    };
}
