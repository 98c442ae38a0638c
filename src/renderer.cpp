#include "renderer.h"

#include <limits>

namespace ember
{
    static constexpr uint32_t DebugClipRectColor = ToRGBA(150, 255, 150);

    static bool AreSame(const ImRect& lhs, const ImRect& rhs)
    {
        return lhs.Min.x == rhs.Min.x && lhs.Min.y == rhs.Min.y &&
            lhs.Max.x == rhs.Max.x && lhs.Max.y == rhs.Max.y;
    }

    ImVec2 ImGuiMeasureText(std::string_view text, void* fontptr, float sz, float wrapWidth)
    {
        auto imfont = (ImFont*)fontptr;
        if (imfont == nullptr)
            return ImVec2{ (float)text.size() * sz * 0.5f, sz };

        return imfont->CalcTextSizeA(sz, FLT_MAX, wrapWidth > 0.f ? wrapWidth : 0.f,
            text.data(), text.data() + text.size());
    }

    ImGuiTessellator::ImGuiTessellator(ImFontAtlas* atlas)
        : _atlas{ atlas }
    {
        // Same as ImGuiStyle::CircleTessellationMaxError
        _shared.SetCircleTessellationMaxError(0.30f);
        _shared.FontAtlas = atlas;
        _drawList = std::make_unique<ImDrawList>(&_shared);
    }

    ImGuiTessellator::~ImGuiTessellator()
    {}

    PaintBatches ImGuiTessellator::Tessellate(const PaintOptions& options, const Fonts& fonts,
        const std::vector<ClippedPaintCmd>& commands)
    {
        PaintBatches batches;
        auto flags = options.antiAlias ? (ImDrawListFlags_AntiAliasedLines | ImDrawListFlags_AntiAliasedFill) :
            ImDrawListFlags_None;
        auto& dl = *_drawList;

        // The white pixel moves whenever the atlas is rebuilt
        if (_atlas != nullptr)
        {
            _shared.TexUvWhitePixel = _atlas->TexUvWhitePixel;
            _shared.TexUvLines = _atlas->TexUvLines;
        }

        for (const auto& [clip, cmd] : commands)
        {
            auto newBatch = batches.empty() || !AreSame(batches.back().first, clip);

            dl._ResetForNewFrame();
            dl.Flags = flags;
            dl._FringeScale = options.aaSize;
            dl.PushClipRect(clip.Min, clip.Max, false);
            if (_atlas != nullptr) dl.PushTexture(_atlas->TexRef);

            if (newBatch && options.debugPaintClipRects && clip.Min.x > -FLT_MAX && clip.Max.x < FLT_MAX)
                dl.AddRect(clip.Min, clip.Max, DebugClipRectColor, 0.f, ImDrawFlags_None, 1.f);

            Draw(cmd, fonts);
            if (_atlas != nullptr) dl.PopTexture();
            dl.PopClipRect();

            auto vtxcount = dl.VtxBuffer.Size + (int)cmd.triangles.vertices.size();
            if (!newBatch && batches.back().second.vertices.size() + vtxcount > std::numeric_limits<ImDrawIdx>::max())
                newBatch = true;

            if (newBatch) batches.emplace_back(clip, Triangles{});

            auto& triangles = batches.back().second;
            Collect(triangles, dl.VtxBuffer.Data, dl.VtxBuffer.Size, dl.IdxBuffer.Data, dl.IdxBuffer.Size);

            if (cmd.type == PaintCmdType::Triangles)
                Collect(triangles, cmd.triangles.vertices.data(), (int)cmd.triangles.vertices.size(),
                    cmd.triangles.indices.data(), (int)cmd.triangles.indices.size());
        }

        return batches;
    }

    void ImGuiTessellator::Collect(Triangles& triangles, const ImDrawVert* vertices, int vtxcount,
        const ImDrawIdx* indices, int idxcount)
    {
        auto base = (ImDrawIdx)triangles.vertices.size();
        triangles.vertices.insert(triangles.vertices.end(), vertices, vertices + vtxcount);

        triangles.indices.reserve(triangles.indices.size() + idxcount);
        for (auto idx = 0; idx < idxcount; ++idx)
            triangles.indices.push_back((ImDrawIdx)(base + indices[idx]));
    }

    void ImGuiTessellator::Draw(const PaintCmd& cmd, const Fonts& fonts)
    {
        auto& dl = *_drawList;

        switch (cmd.type)
        {
        case PaintCmdType::Circle:
        {
            const auto& circle = cmd.params.circle;
            if (IsColorVisible(circle.fill))
                dl.AddCircleFilled(circle.center, circle.radius, circle.fill);
            if (circle.outline.IsVisible())
                dl.AddCircle(circle.center, circle.radius, circle.outline.color, 0, circle.outline.width);
            break;
        }

        case PaintCmdType::LineSegment:
        {
            const auto& line = cmd.params.line;
            if (line.style.IsVisible())
                dl.AddLine(line.start, line.end, line.style.color, line.style.width);
            break;
        }

        case PaintCmdType::Path:
        {
            const auto& path = cmd.params.path;
            auto count = (int)cmd.points.size();
            if (count < 2) break;

            if (path.closed && IsColorVisible(path.fill))
                dl.AddConvexPolyFilled(cmd.points.data(), count, path.fill);
            if (path.outline.IsVisible())
                dl.AddPolyline(cmd.points.data(), count, path.outline.color,
                    path.closed ? ImDrawFlags_Closed : ImDrawFlags_None, path.outline.width);
            break;
        }

        case PaintCmdType::Rect:
        {
            const auto& rect = cmd.params.rect;
            if (IsColorVisible(rect.fill))
                dl.AddRectFilled(rect.rect.Min, rect.rect.Max, rect.fill, rect.cornerRadius);
            if (rect.outline.IsVisible())
                dl.AddRect(rect.rect.Min, rect.rect.Max, rect.outline.color, rect.cornerRadius,
                    ImDrawFlags_None, rect.outline.width);
            break;
        }

        case PaintCmdType::Text:
        {
            const auto& text = cmd.params.text;
            auto imfont = (ImFont*)fonts.Handle(text.style);
            if (_atlas == nullptr || imfont == nullptr || cmd.text.empty() || !IsColorVisible(text.color)) break;

            auto sz = fonts.Size(text.style);
            auto wrapWidth = text.wrapWidth < FLT_MAX ? text.wrapWidth : 0.f;
            auto pos = text.pos;

            if (text.align != Align::Min)
            {
                auto width = ImGuiMeasureText(cmd.text, imfont, sz, wrapWidth).x;
                pos.x -= text.align == Align::Center ? width * 0.5f : width;
            }

            dl.AddText(imfont, sz, pos, text.color, cmd.text.data(), cmd.text.data() + cmd.text.size(), wrapWidth);
            break;
        }

        case PaintCmdType::Noop:
        case PaintCmdType::Triangles:
            break;
        }
    }
}
