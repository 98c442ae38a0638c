#pragma once

#include "types.h"

#include <string>
#include <string_view>
#include <vector>

namespace ember
{
    enum TextStyle : int32_t
    {
        TS_Body,
        TS_Button,
        TS_Heading,
        TS_Monospace,
        TS_Total
    };

    struct FontSpec
    {
        std::string family;
        float size = 14.f; // in points

        bool operator==(const FontSpec& other) const { return family == other.family && size == other.size; }
        bool operator!=(const FontSpec& other) const { return !(*this == other); }
    };

    struct FontDefinitions
    {
        // Overwritten with the input's scale factor at the start of every frame
        float pixelsPerPoint = 1.f;

        FontSpec fonts[TS_Total] = {
            { EMBER_DEFAULT_FONTFAMILY, 14.f },
            { EMBER_DEFAULT_FONTFAMILY, 14.f },
            { EMBER_DEFAULT_FONTFAMILY, 20.f },
            { EMBER_MONOSPACE_FONTFAMILY, 13.f }
        };

        bool operator==(const FontDefinitions& other) const;
        bool operator!=(const FontDefinitions& other) const { return !(*this == other); }
    };

    struct GalleyLine
    {
        float y = 0.f;
        float height = 0.f;
        int32_t begin = 0; // Byte range of the line within Galley::text
        int32_t end = 0;
        std::vector<float> xOffsets; // Left edge of every glyph, plus the right edge of the last one
    };

    // A block of laid out text, positions are relative to its top-left corner
    struct Galley
    {
        std::string text;
        ImVec2 size;
        float wrapWidth = FLT_MAX;
        std::vector<GalleyLine> lines;
    };

    struct Fonts
    {
        [[nodiscard]] static Fonts FromDefinitions(FontDefinitions definitions);

        const FontDefinitions& Definitions() const { return _definitions; }
        void* Handle(TextStyle style) const { return _handles[style]; }
        float Size(TextStyle style) const { return _definitions.fonts[style].size; }

        [[nodiscard]] Galley Layout(TextStyle style, std::string_view text, float wrapWidth = FLT_MAX) const;

    private:

        FontDefinitions _definitions;
        void* _handles[TS_Total] = { nullptr, nullptr, nullptr, nullptr };
    };
}
