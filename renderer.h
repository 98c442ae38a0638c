#pragma once

#include "paint.h"

#include <memory>
#include <string_view>

namespace ember
{
    // Tessellates paint commands through an ImDrawList, one command at a time, so that the
    // vertices of each command can be collected into the batch of its clip rect. Vertices
    // sample the white pixel of the font atlas, usually ImGui::GetIO().Fonts. Without an
    // atlas shapes are still tessellated with zero uvs, and text is skipped. Text needs the
    // font handles to be ImFont* of that atlas.
    struct ImGuiTessellator final : public ITessellator
    {
        explicit ImGuiTessellator(ImFontAtlas* atlas);
        ~ImGuiTessellator();

        PaintBatches Tessellate(const PaintOptions& options, const Fonts& fonts,
            const std::vector<ClippedPaintCmd>& commands) override;

    private:

        void Draw(const PaintCmd& cmd, const Fonts& fonts);
        void Collect(Triangles& triangles, const ImDrawVert* vertices, int vtxcount, const ImDrawIdx* indices, int idxcount);

        ImFontAtlas* _atlas = nullptr;
        ImDrawListSharedData _shared;
        std::unique_ptr<ImDrawList> _drawList;
    };

    // Text measure hook for Config.textMeasure, fontptr is an ImFont*
    ImVec2 ImGuiMeasureText(std::string_view text, void* fontptr, float sz, float wrapWidth);
}
