#include "style.h"

#include <cstdio>

namespace ember
{
    static constexpr float CheckboxSide = 16.f;
    static constexpr float CheckmarkSide = 10.f;
    static constexpr float RadioRadius = 8.f;
    static constexpr float SliderTrackHeight = 8.f;
    static constexpr float SliderMarkerSide = 16.f;
    static constexpr float LabelSpacing = 4.f;

    uint32_t Style::FillColor(const InteractInfo& interact) const
    {
        return interact.active ? activeFill : interact.hovered ? hoveredFill : idleFill;
    }

    uint32_t Style::StrokeColor(const InteractInfo& interact) const
    {
        return interact.active ? activeStroke : interact.hovered ? hoveredStroke : idleStroke;
    }

#pragma region GuiCmd

    GuiCmd GuiCmd::MakePaintCommands(std::vector<PaintCmd> commands)
    {
        GuiCmd cmd;
        cmd.type = GuiCmdType::PaintCommands;
        cmd.commands = std::move(commands);
        return cmd;
    }

    GuiCmd GuiCmd::MakeButton(const InteractInfo& interact, const ImRect& rect, std::string text)
    {
        GuiCmd cmd;
        cmd.type = GuiCmdType::Button;
        cmd.interact = interact;
        cmd.rect = rect;
        cmd.text = std::move(text);
        cmd.style = TS_Button;
        return cmd;
    }

    GuiCmd GuiCmd::MakeCheckbox(bool checked, const InteractInfo& interact, const ImRect& rect, std::string text)
    {
        GuiCmd cmd;
        cmd.type = GuiCmdType::Checkbox;
        cmd.checked = checked;
        cmd.interact = interact;
        cmd.rect = rect;
        cmd.text = std::move(text);
        return cmd;
    }

    GuiCmd GuiCmd::MakeRadioButton(bool checked, const InteractInfo& interact, const ImRect& rect, std::string text)
    {
        GuiCmd cmd;
        cmd.type = GuiCmdType::RadioButton;
        cmd.checked = checked;
        cmd.interact = interact;
        cmd.rect = rect;
        cmd.text = std::move(text);
        return cmd;
    }

    GuiCmd GuiCmd::MakeSlider(const InteractInfo& interact, std::string label, float min, float max,
        const ImRect& rect, float value)
    {
        GuiCmd cmd;
        cmd.type = GuiCmdType::Slider;
        cmd.interact = interact;
        cmd.text = std::move(label);
        cmd.min = min;
        cmd.max = max;
        cmd.rect = rect;
        cmd.value = value;
        return cmd;
    }

    GuiCmd GuiCmd::MakeText(ImVec2 pos, std::string text, Align align, TextStyle style)
    {
        GuiCmd cmd;
        cmd.type = GuiCmdType::Text;
        cmd.pos = pos;
        cmd.text = std::move(text);
        cmd.align = align;
        cmd.style = style;
        return cmd;
    }

#pragma endregion

#pragma region Translation

    static void TranslateButton(std::vector<PaintCmd>& out, const Style& style, const GuiCmd& cmd)
    {
        auto center = cmd.rect.GetCenter();
        out.push_back(PaintCmd::MakeRect(cmd.rect, 5.f, style.FillColor(cmd.interact)));
        out.push_back(PaintCmd::MakeText(ImVec2{ center.x, center.y + 6.f }, cmd.text, cmd.style,
            style.textColor, Align::Center));
    }

    static void TranslateCheckbox(std::vector<PaintCmd>& out, const Style& style, const GuiCmd& cmd)
    {
        auto stroke = style.StrokeColor(cmd.interact);
        auto center = cmd.rect.GetCenter();
        auto box = RectFromCenterSize(ImVec2{ cmd.rect.Min.x + CheckboxSide * 0.5f, center.y },
            ImVec2{ CheckboxSide, CheckboxSide });
        out.push_back(PaintCmd::MakeRect(box, 3.f, style.FillColor(cmd.interact)));

        if (cmd.checked)
        {
            auto mark = RectFromCenterSize(box.GetCenter(), ImVec2{ CheckmarkSide, CheckmarkSide });
            auto markCenter = mark.GetCenter();
            out.push_back(PaintCmd::MakePath({
                    ImVec2{ mark.Min.x, markCenter.y },
                    ImVec2{ markCenter.x, mark.Max.y },
                    ImVec2{ mark.Max.x, mark.Min.y } },
                false, ColorTransparent, LineStyle{ style.lineWidth, stroke }));
        }

        out.push_back(PaintCmd::MakeText(ImVec2{ box.Max.x + LabelSpacing, center.y + 5.f }, cmd.text,
            cmd.style, stroke));
    }

    static void TranslateRadioButton(std::vector<PaintCmd>& out, const Style& style, const GuiCmd& cmd)
    {
        auto stroke = style.StrokeColor(cmd.interact);
        auto center = ImVec2{ cmd.rect.Min.x + RadioRadius, cmd.rect.GetCenter().y };
        out.push_back(PaintCmd::MakeCircle(center, RadioRadius, style.FillColor(cmd.interact)));

        if (cmd.checked)
            out.push_back(PaintCmd::MakeCircle(center, RadioRadius * 0.5f, style.radioDot));

        out.push_back(PaintCmd::MakeText(ImVec2{ cmd.rect.Min.x + 2.f * RadioRadius + LabelSpacing,
            center.y + 7.f }, cmd.text, cmd.style, stroke));
    }

    static void TranslateSlider(std::vector<PaintCmd>& out, const Style& style, const GuiCmd& cmd)
    {
        const auto& rect = cmd.rect;
        auto track = RectFromMinSize(ImVec2{ rect.Min.x, Lerp(rect.Min.y, rect.Max.y, 2.f / 3.f) },
            ImVec2{ rect.GetWidth(), SliderTrackHeight });
        auto markerX = RemapClamp(cmd.value, cmd.min, cmd.max, rect.Min.x, rect.Max.x);
        auto marker = RectFromCenterSize(ImVec2{ markerX, track.GetCenter().y },
            ImVec2{ SliderMarkerSide, SliderMarkerSide });

        out.push_back(PaintCmd::MakeRect(track, 2.f, style.sliderTrack));
        out.push_back(PaintCmd::MakeRect(marker, 3.f, style.FillColor(cmd.interact)));

        char value[64];
        std::snprintf(value, 64, ": %.3f", cmd.value);
        out.push_back(PaintCmd::MakeText(ImVec2{ rect.Min.x, Lerp(rect.Min.y, rect.Max.y, 1.f / 3.f) + 6.f },
            cmd.text + value, cmd.style, style.textColor));
    }

    void TranslateCommand(std::vector<PaintCmd>& out, const Style& style, const GuiCmd& cmd)
    {
        switch (cmd.type)
        {
        case GuiCmdType::PaintCommands:
            out.insert(out.end(), cmd.commands.begin(), cmd.commands.end());
            break;
        case GuiCmdType::Button: TranslateButton(out, style, cmd); break;
        case GuiCmdType::Checkbox: TranslateCheckbox(out, style, cmd); break;
        case GuiCmdType::RadioButton: TranslateRadioButton(out, style, cmd); break;
        case GuiCmdType::Slider: TranslateSlider(out, style, cmd); break;
        case GuiCmdType::Text:
            out.push_back(PaintCmd::MakeText(cmd.pos + ImVec2{ 0.f, 7.f }, cmd.text, cmd.style,
                style.textColor, cmd.align));
            break;
        }
    }

    std::vector<PaintCmd> IntoPaintCommands(std::span<const GuiCmd> commands, const Style& style)
    {
        std::vector<PaintCmd> result;
        for (const auto& cmd : commands)
            TranslateCommand(result, style, cmd);
        return result;
    }

#pragma endregion
}
