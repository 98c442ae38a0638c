#include "context.h"
#include "ui.h"

#include <cstdio>
#include <cstdarg>
#include <cstdlib>
#include <cmath>

namespace ember
{
    static int64_t TotalFramesBegun = 0;

    int64_t FramesBegun()
    {
        return TotalFramesBegun;
    }

    void FatalError(const char* fmt, ...)
    {
        char buffer[EMBER_MESSAGE_BUFSZ];
        va_list args;
        va_start(args, fmt);
        std::vsnprintf(buffer, EMBER_MESSAGE_BUFSZ, fmt, args);
        va_end(args);

        LOGERROR("%s", buffer);
        if (Config.logger != nullptr) Config.logger->Log("%s", buffer);
        if (Config.fatal != nullptr) Config.fatal(buffer);
        std::abort();
    }

#pragma region Frame lifecycle

    // A Ui for the entire screen, behind any window
    static Ui FullscreenUi(const std::shared_ptr<Context>& context)
    {
        auto rect = context->Rect();
        auto layer = Layer::Background();

        // Registering the background area ensures it is painted even when nothing is on it
        context->GetMemory()->areas.SetState(layer, AreaState{ rect.Min, rect.GetSize(), true, ImVec2{} });
        return Ui{ context, layer, layer.id, rect };
    }

    Ui BeginFrame(std::shared_ptr<Context>& context, RawInput input)
    {
        auto next = std::make_shared<Context>(*context);
        next->Advance(std::move(input));
        context = next;
        return FullscreenUi(context);
    }

    std::shared_ptr<Context> Context::Create()
    {
        return std::make_shared<Context>();
    }

    void Context::Advance(RawInput input)
    {
        ++TotalFramesBegun;

        // Ownership release depends on what the mouse did in the previous frame
        GetMemory()->BeginFrame(_input);
        _usedIds.Lock()->clear();
        _input = _input.BeginFrame(std::move(input));
        GetGraphics()->Clear();

        {
            auto definitions = _fontDefinitions.Lock();
            definitions->pixelsPerPoint = _input.pixelsPerPoint;

            if (!_fonts || _fonts->Definitions() != *definitions)
            {
                LOG("Rebuilding fonts at %.2f pixels per point\n", definitions->pixelsPerPoint);
                _fonts = std::make_shared<const Fonts>(Fonts::FromDefinitions(*definitions));
            }
        }

        if (Config.logger != nullptr) Config.logger->EnterFrame(FramesBegun(), _input.screenSize);
    }

    FrameOutput Context::EndFrame()
    {
        GetMemory()->EndFrame();

        FrameOutput result;
        {
            auto output = GetOutput();
            result.output = std::move(*output);
            *output = Output{};
        }

        Paint(result);

        if (Config.logger != nullptr) Config.logger->ExitFrame(result.stats);
        EVERY_NTHFRAME(600, "Frame #%lld : %d primitives, %d vertices\n", (long long)FramesBegun(),
            result.stats.primitives, result.stats.vertices);
        return result;
    }

    void Context::Paint(FrameOutput& result)
    {
        auto options = GetPaintOptions();
        options.aaSize = 1.5f / PixelsPerPoint();

        // Copied out, the memory and graphics locks are never held together
        auto order = GetMemory()->areas.Order();
        result.primitives = GetGraphics()->Drain(order);

        if (Config.tessellator != nullptr)
            result.batches = Config.tessellator->Tessellate(options, GetFonts(), result.primitives);

        result.stats.batches = (int32_t)result.batches.size();
        result.stats.primitives = (int32_t)result.primitives.size();
        for (const auto& [clip, triangles] : result.batches)
        {
            result.stats.vertices += (int32_t)triangles.vertices.size();
            result.stats.triangles += (int32_t)triangles.indices.size() / 3;
        }

        _paintStats.Set(result.stats);
    }

#pragma endregion

#pragma region Accessors

    ImRect Context::Rect() const
    {
        return RectFromMinSize(ImVec2{ 0.f, 0.f }, _input.screenSize);
    }

    const Fonts& Context::GetFonts() const
    {
        if (!_fonts)
            FatalError("No fonts available until the first call to BeginFrame\n");
        return *_fonts;
    }

    void Context::SetFonts(FontDefinitions definitions)
    {
        _fontDefinitions.Set(std::move(definitions));
    }

    void Context::ResetMemory()
    {
        *GetMemory() = Memory{};
    }

    float Context::RoundToPixel(float point) const
    {
        return std::round(point * _input.pixelsPerPoint) / _input.pixelsPerPoint;
    }

    ImVec2 Context::RoundPosToPixels(ImVec2 pos) const
    {
        return ImVec2{ RoundToPixel(pos.x), RoundToPixel(pos.y) };
    }

    ImVec2 Context::RoundVecToPixels(ImVec2 vec) const
    {
        return ImVec2{ RoundToPixel(vec.x), RoundToPixel(vec.y) };
    }

    ImRect Context::RoundRectToPixels(const ImRect& rect) const
    {
        return ImRect{ RoundPosToPixels(rect.Min), RoundPosToPixels(rect.Max) };
    }

#pragma endregion

#pragma region Ids

    Id Context::RegisterUniqueId(Id id, std::string_view sourceName, ImVec2 pos)
    {
        std::optional<ImVec2> clashPos;

        {
            auto usedIds = _usedIds.Lock();
            auto [it, inserted] = usedIds->try_emplace(id, pos);
            if (!inserted)
            {
                clashPos = it->second;
                it->second = pos;
            }
        }

        if (Config.logger != nullptr) Config.logger->RegisterId(id, sourceName, pos);

        // Within the tolerance it is the same widget registering again, e.g. a window whose
        // contents are shown twice in one frame
        if (clashPos.has_value() && Distance(*clashPos, pos) >= EMBER_ID_CLASH_TOLERANCE)
        {
            char buffer[EMBER_MESSAGE_BUFSZ];
            LOGERROR("Id %u (%.*s) used at (%.1f, %.1f) and (%.1f, %.1f)\n", id.value, (int)sourceName.size(),
                sourceName.data(), clashPos->x, clashPos->y, pos.x, pos.y);

            std::snprintf(buffer, EMBER_MESSAGE_BUFSZ, "first use of non-unique ID %.*s (name clash?)",
                (int)sourceName.size(), sourceName.data());
            ShowError(*clashPos, buffer);

            std::snprintf(buffer, EMBER_MESSAGE_BUFSZ, "second use of non-unique ID %.*s (name clash?)",
                (int)sourceName.size(), sourceName.data());
            ShowError(pos, buffer);

            if (Config.logger != nullptr) Config.logger->IdClash(id, sourceName, *clashPos, pos);
        }

        return id;
    }

    Id Context::MakeUniqueId(std::string_view source, ImVec2 pos)
    {
        return RegisterUniqueId(Id::Make(source), source, pos);
    }

    Id Context::MakeUniqueId(int64_t source, ImVec2 pos)
    {
        char name[32];
        std::snprintf(name, 32, "%lld", (long long)source);
        return RegisterUniqueId(Id::Make(source), name, pos);
    }

#pragma endregion

#pragma region Interaction

    std::optional<Layer> Context::LayerAt(ImVec2 pos)
    {
        auto tolerance = GetStyle().resizeInteractRadiusSide;
        return GetMemory()->LayerAt(pos, tolerance);
    }

    bool Context::ContainsMouse(Layer layer, const ImRect& clipRect, const ImRect& rect)
    {
        if (!_input.mouse.pos.has_value()) return false;

        auto pos = *_input.mouse.pos;
        return ContainsInclusive(rect, pos) && ContainsInclusive(clipRect, pos) && LayerAt(pos) == layer;
    }

    InteractInfo Context::Interact(Layer layer, const ImRect& clipRect, const ImRect& rect,
        std::optional<Id> id, int32_t sense)
    {
        // Make it easier to click
        auto interactRect = Expanded(rect, GetStyle().itemSpacing * 0.5f);
        InteractInfo result;
        result.rect = rect;
        result.hovered = ContainsMouse(layer, clipRect, interactRect);

        if (!id.has_value() || sense == Sense_Nothing)
            return result;

        auto memory = GetMemory();
        auto& interaction = memory->interaction;
        const auto& mouse = _input.mouse;
        auto hovered = result.hovered;

        interaction.clickInterest |= hovered && (sense & Sense_Click);
        interaction.dragInterest |= hovered && (sense & Sense_Drag);

        auto active = interaction.clickId == id || interaction.dragId == id;

        if (mouse.pressed)
        {
            // A press outside is a miss, and changes nothing
            if (hovered)
            {
                auto claimed = false;

                if ((sense & Sense_Click) && !interaction.clickId.has_value())
                {
                    interaction.clickId = id;
                    claimed = true;
                }

                // A window being moved lets go of the drag as soon as a widget wants it
                if ((sense & Sense_Drag) && (!interaction.dragId.has_value() || interaction.dragIsWindow))
                {
                    interaction.dragId = id;
                    interaction.dragIsWindow = false;
                    memory->StopWindowInteraction();
                    claimed = true;
                }

                result.active = claimed;
                if (claimed && Config.logger != nullptr)
                    Config.logger->OwnershipChanged(interaction.clickId, interaction.dragId);
            }
        }
        else if (mouse.released)
        {
            result.clicked = hovered && active;
            result.doubleClicked = result.clicked && mouse.doubleClick;
            result.active = active;
        }
        else if (mouse.down)
        {
            result.hovered = hovered && active;
            result.active = active;
        }
        else
            result.active = active;

        return result;
    }

#pragma endregion

#pragma region Painting

    void Context::AddPaintCmd(Layer layer, PaintCmd cmd)
    {
        GetGraphics()->Push(layer, EverythingRect(), std::move(cmd));
    }

    void Context::ShowError(ImVec2 pos, std::string_view text)
    {
        auto layer = Layer::Debug();

        // Diagnostics are still painted without a text measure, sized by estimate
        if (Config.textMeasure == nullptr)
        {
            auto sz = GetFonts().Size(TS_Monospace);
            auto rect = RectFromMinSize(pos, ImVec2{ (float)text.size() * sz * 0.5f, sz });
            AddPaintCmd(layer, PaintCmd::MakeRect(Expanded(rect, 2.f), 0.f, Gray(0, 240), LineStyle{ 1.f, ColorRed }));
            AddPaintCmd(layer, PaintCmd::MakeText(rect.Min, std::string{ text }, TS_Monospace, ColorRed));
            return;
        }

        auto galley = GetFonts().Layout(TS_Monospace, text);
        auto rect = AlignRect(RectFromMinSize(pos, galley.size), Align::Min, Align::Min);
        AddPaintCmd(layer, PaintCmd::MakeRect(Expanded(rect, 2.f), 0.f, Gray(0, 240), LineStyle{ 1.f, ColorRed }));
        AddGalley(layer, rect.Min, std::move(galley), TS_Monospace, ColorRed);
    }

    void Context::DebugText(ImVec2 pos, std::string_view text)
    {
        FloatingText(Layer::Debug(), pos, text, TS_Monospace, Align::Min, Align::Min, ColorYellow);
    }

    void Context::DebugRect(const ImRect& rect, uint32_t color, std::string_view name)
    {
        char buffer[EMBER_MESSAGE_BUFSZ];
        std::snprintf(buffer, EMBER_MESSAGE_BUFSZ, "%.*s [%.1f, %.1f - %.1f, %.1f]", (int)name.size(), name.data(),
            rect.Min.x, rect.Min.y, rect.Max.x, rect.Max.y);

        AddPaintCmd(Layer::Debug(), PaintCmd::MakeRect(rect, 0.f, ColorTransparent, LineStyle{ 2.f, color }));
        FloatingText(Layer::Debug(), rect.Min, buffer, TS_Monospace, Align::Min, Align::Min, color);
    }

    ImRect Context::FloatingText(Layer layer, ImVec2 pos, std::string_view text, TextStyle style,
        Align horizontal, Align vertical, std::optional<uint32_t> color)
    {
        auto galley = GetFonts().Layout(style, text);
        auto rect = AlignRect(RectFromMinSize(pos, galley.size), horizontal, vertical);
        AddGalley(layer, rect.Min, std::move(galley), style, color);
        return rect;
    }

    void Context::AddGalley(Layer layer, ImVec2 pos, Galley galley, TextStyle style, std::optional<uint32_t> color)
    {
        auto textColor = color.has_value() ? *color : GetStyle().textColor;
        AddPaintCmd(layer, PaintCmd::MakeText(pos, std::move(galley.text), style, textColor,
            Align::Min, galley.wrapWidth));
    }

#pragma endregion

    // This is a global config which is expected to be set during initialization,
    // before the first frame begins
    UIConfig Config{};
}
