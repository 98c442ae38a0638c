#pragma once

#include "types.h"
#include "paint.h"

#include <span>
#include <string>
#include <vector>

namespace ember
{
    struct Style
    {
        // Horizontal and vertical spacing between widgets, interaction rects grow by half of it
        ImVec2 itemSpacing{ 8.f, 4.f };
        ImVec2 buttonPadding{ 5.f, 3.f };
        ImVec2 windowPadding{ 6.f, 6.f };
        float indent = 21.f;

        // Areas can be hit this far outside their rect, to grab their edges for resizing
        float resizeInteractRadiusSide = 5.f;

        // For stuff like check marks in check boxes
        float lineWidth = 2.f;

        uint32_t textColor = ToRGBA(255, 255, 255, 187);
        uint32_t activeFill = ToRGBA(136, 136, 136);
        uint32_t hoveredFill = ToRGBA(100, 100, 100);
        uint32_t idleFill = ToRGBA(68, 68, 68);
        uint32_t activeStroke = ToRGBA(255, 255, 255, 255);
        uint32_t hoveredStroke = ToRGBA(255, 255, 255, 200);
        uint32_t idleStroke = ToRGBA(255, 255, 255, 170);
        uint32_t sliderTrack = ToRGBA(34, 34, 34);
        uint32_t radioDot = ToRGBA(0, 0, 0);

        uint32_t FillColor(const InteractInfo& interact) const;
        uint32_t StrokeColor(const InteractInfo& interact) const;
    };

    enum class GuiCmdType : int16_t
    {
        PaintCommands, Button, Checkbox, RadioButton, Slider, Text
    };

    // What a widget wants to look like, before any styling is applied
    struct GuiCmd
    {
        GuiCmdType type = GuiCmdType::PaintCommands;
        InteractInfo interact;
        ImRect rect;
        std::string text; // Label of checkboxes, radio buttons and sliders
        bool checked = false;
        float min = 0.f, max = 1.f, value = 0.f;
        ImVec2 pos;
        Align align = Align::Min;
        TextStyle style = TS_Body;
        std::vector<PaintCmd> commands;

        [[nodiscard]] static GuiCmd MakePaintCommands(std::vector<PaintCmd> commands);
        [[nodiscard]] static GuiCmd MakeButton(const InteractInfo& interact, const ImRect& rect, std::string text);
        [[nodiscard]] static GuiCmd MakeCheckbox(bool checked, const InteractInfo& interact, const ImRect& rect, std::string text);
        [[nodiscard]] static GuiCmd MakeRadioButton(bool checked, const InteractInfo& interact, const ImRect& rect, std::string text);
        [[nodiscard]] static GuiCmd MakeSlider(const InteractInfo& interact, std::string label, float min, float max,
            const ImRect& rect, float value);
        [[nodiscard]] static GuiCmd MakeText(ImVec2 pos, std::string text, Align align, TextStyle style);
    };

    // Pure translation, the same command and style always produce the same primitives
    void TranslateCommand(std::vector<PaintCmd>& out, const Style& style, const GuiCmd& cmd);
    [[nodiscard]] std::vector<PaintCmd> IntoPaintCommands(std::span<const GuiCmd> commands, const Style& style);
}
