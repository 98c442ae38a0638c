#include "paint.h"

#include <algorithm>
#include <iterator>

namespace ember
{
#pragma region Paint commands

    PaintCmd PaintCmd::MakeCircle(ImVec2 center, float radius, uint32_t fill, LineStyle outline)
    {
        PaintCmd cmd;
        cmd.type = PaintCmdType::Circle;
        cmd.params.circle.center = center;
        cmd.params.circle.radius = radius;
        cmd.params.circle.fill = fill;
        cmd.params.circle.outline = outline;
        return cmd;
    }

    PaintCmd PaintCmd::MakeLine(ImVec2 start, ImVec2 end, LineStyle style)
    {
        PaintCmd cmd;
        cmd.type = PaintCmdType::LineSegment;
        cmd.params.line.start = start;
        cmd.params.line.end = end;
        cmd.params.line.style = style;
        return cmd;
    }

    PaintCmd PaintCmd::MakePath(std::vector<ImVec2> points, bool closed, uint32_t fill, LineStyle outline)
    {
        PaintCmd cmd;
        cmd.type = PaintCmdType::Path;
        cmd.points = std::move(points);
        cmd.params.path.closed = closed;
        cmd.params.path.fill = fill;
        cmd.params.path.outline = outline;
        return cmd;
    }

    PaintCmd PaintCmd::MakeRect(const ImRect& rect, float cornerRadius, uint32_t fill, LineStyle outline)
    {
        PaintCmd cmd;
        cmd.type = PaintCmdType::Rect;
        cmd.params.rect.rect = rect;
        cmd.params.rect.cornerRadius = cornerRadius;
        cmd.params.rect.fill = fill;
        cmd.params.rect.outline = outline;
        return cmd;
    }

    PaintCmd PaintCmd::MakeText(ImVec2 pos, std::string text, TextStyle style, uint32_t color, Align align, float wrapWidth)
    {
        PaintCmd cmd;
        cmd.type = PaintCmdType::Text;
        cmd.text = std::move(text);
        cmd.params.text.pos = pos;
        cmd.params.text.style = style;
        cmd.params.text.align = align;
        cmd.params.text.color = color;
        cmd.params.text.wrapWidth = wrapWidth;
        return cmd;
    }

    PaintCmd PaintCmd::MakeTriangles(Triangles triangles)
    {
        PaintCmd cmd;
        cmd.type = PaintCmdType::Triangles;
        cmd.triangles = std::move(triangles);
        return cmd;
    }

#pragma endregion

#pragma region Graphic layers

    std::vector<ClippedPaintCmd>& GraphicLayers::List(Layer layer)
    {
        auto it = _layers.find(layer);
        if (it == _layers.end())
        {
            it = _layers.emplace(layer, std::vector<ClippedPaintCmd>{}).first;
            it->second.reserve(EMBER_LAYER_PREALLOC);
        }

        return it->second;
    }

    void GraphicLayers::Push(Layer layer, const ImRect& clipRect, PaintCmd cmd)
    {
        List(layer).emplace_back(clipRect, std::move(cmd));
    }

    std::vector<ClippedPaintCmd> GraphicLayers::Drain(const std::vector<Layer>& order)
    {
        std::vector<ClippedPaintCmd> result;
        result.reserve(Count());

        auto take = [&](Layer layer) {
            auto it = _layers.find(layer);
            if (it != _layers.end())
            {
                std::move(it->second.begin(), it->second.end(), std::back_inserter(result));
                _layers.erase(it);
            }
        };

        // Diagnostics go on top of everything, wherever the registry placed the debug layer
        for (auto layer : order)
            if (layer != Layer::Debug())
                take(layer);

        take(Layer::Debug());

#ifdef _DEBUG
        for (const auto& [layer, cmds] : _layers)
            if (!cmds.empty())
                LOG("Discarding %d paint commands of unregistered layer %u\n", (int)cmds.size(), layer.id.value);
#endif

        _layers.clear();
        return result;
    }

    bool GraphicLayers::Empty() const
    {
        return Count() == 0;
    }

    size_t GraphicLayers::Count() const
    {
        size_t total = 0;
        for (const auto& [layer, cmds] : _layers)
            total += cmds.size();
        return total;
    }

#pragma endregion
}
