#include "fonts.h"

#include <algorithm>

namespace ember
{
    struct Glyph
    {
        int32_t begin = 0, end = 0;
        unsigned int codepoint = 0;
        ImVec2 size;
    };

    bool FontDefinitions::operator==(const FontDefinitions& other) const
    {
        if (pixelsPerPoint != other.pixelsPerPoint) return false;

        for (auto style = 0; style < TS_Total; ++style)
            if (fonts[style] != other.fonts[style]) return false;

        return true;
    }

    Fonts Fonts::FromDefinitions(FontDefinitions definitions)
    {
        Fonts result;
        result._definitions = std::move(definitions);

        for (auto style = 0; style < TS_Total; ++style)
        {
            const auto& spec = result._definitions.fonts[style];
            result._handles[style] = Config.fontLoader != nullptr ?
                Config.fontLoader(spec.family, spec.size * result._definitions.pixelsPerPoint) : nullptr;
            LOG("Loaded font %s at %.1fpx for text style %d\n", spec.family.c_str(),
                spec.size * result._definitions.pixelsPerPoint, style);
        }

        return result;
    }

    Galley Fonts::Layout(TextStyle style, std::string_view text, float wrapWidth) const
    {
        if (Config.textMeasure == nullptr)
            FatalError("Text layout requires Config.textMeasure to be set\n");

        Galley galley;
        galley.text = std::string{ text };
        galley.wrapWidth = wrapWidth;

        auto fontptr = _handles[style];
        auto fontsz = Size(style);
        std::vector<Glyph> glyphs;
        int32_t lineBegin = 0;
        float lineWidth = 0.f, y = 0.f, width = 0.f;

        // Moves the first count glyphs into a new line
        auto emit = [&](size_t count, int32_t end) {
            auto& line = galley.lines.emplace_back();
            line.y = y;
            line.height = fontsz;
            line.begin = lineBegin;
            line.end = end;
            line.xOffsets.reserve(count + 1);
            line.xOffsets.push_back(0.f);

            for (auto idx = 0u; idx < count; ++idx)
            {
                line.xOffsets.push_back(line.xOffsets.back() + glyphs[idx].size.x);
                line.height = std::max(line.height, glyphs[idx].size.y);
            }

            width = std::max(width, line.xOffsets.back());
            y += line.height;
            glyphs.erase(glyphs.begin(), glyphs.begin() + count);
        };

        const char* start = text.data();
        const char* end = start + text.size();
        const char* ptr = start;

        while (ptr < end)
        {
            unsigned int codepoint = 0;
            auto bytes = ImTextCharFromUtf8(&codepoint, ptr, end);
            auto begin = (int32_t)(ptr - start);
            ptr += bytes;

            if (codepoint == '\n')
            {
                emit(glyphs.size(), begin);
                lineBegin = begin + bytes;
                lineWidth = 0.f;
                continue;
            }

            auto glyphsz = Config.textMeasure(std::string_view{ start + begin, (size_t)bytes }, fontptr, fontsz, -1.f);

            if (!glyphs.empty() && lineWidth + glyphsz.x > wrapWidth)
            {
                auto space = std::find_if(glyphs.rbegin(), glyphs.rend(),
                    [](const Glyph& glyph) { return glyph.codepoint == ' '; });

                if (space != glyphs.rend())
                {
                    // The space itself belongs to neither line
                    auto spaceGlyph = *space;
                    emit((size_t)(glyphs.rend() - space) - 1u, spaceGlyph.begin);
                    glyphs.erase(glyphs.begin());
                    lineBegin = spaceGlyph.end;
                }
                else
                {
                    emit(glyphs.size(), begin);
                    lineBegin = begin;
                }

                lineWidth = 0.f;
                for (const auto& glyph : glyphs) lineWidth += glyph.size.x;
            }

            glyphs.push_back(Glyph{ begin, begin + bytes, codepoint, glyphsz });
            lineWidth += glyphsz.x;
        }

        emit(glyphs.size(), (int32_t)text.size());
        galley.size = ImVec2{ width, y };
        return galley;
    }
}
