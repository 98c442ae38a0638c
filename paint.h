#pragma once

#include "types.h"
#include "fonts.h"

#include <string>
#include <vector>
#include <unordered_map>
#include <utility>

namespace ember
{
    enum class PaintCmdType : int16_t
    {
        Noop, Circle, LineSegment, Path, Rect, Text, Triangles
    };

    // A width of zero or an invisible color means no outline
    struct LineStyle
    {
        float width = 0.f;
        uint32_t color = ColorTransparent;

        bool IsVisible() const { return width > 0.f && IsColorVisible(color); }
    };

    struct Triangles
    {
        std::vector<ImDrawVert> vertices;
        std::vector<ImDrawIdx> indices;
    };

    union PaintParams
    {
        struct {
            ImVec2 center;
            float radius;
            uint32_t fill;
            LineStyle outline;
        } circle;

        struct {
            ImVec2 start, end;
            LineStyle style;
        } line;

        struct {
            bool closed;
            uint32_t fill;
            LineStyle outline;
        } path;

        struct {
            ImRect rect;
            float cornerRadius;
            uint32_t fill;
            LineStyle outline;
        } rect;

        struct {
            ImVec2 pos;
            TextStyle style;
            Align align;
            uint32_t color;
            float wrapWidth;
        } text;

        PaintParams() {}
    };

    // One drawable primitive, complete enough to be tessellated on its own. A fill color
    // of zero means the shape is not filled.
    struct PaintCmd
    {
        PaintCmdType type = PaintCmdType::Noop;
        PaintParams params;
        std::string text;           // PaintCmdType::Text
        std::vector<ImVec2> points; // PaintCmdType::Path
        Triangles triangles;        // PaintCmdType::Triangles

        [[nodiscard]] static PaintCmd MakeCircle(ImVec2 center, float radius, uint32_t fill, LineStyle outline = {});
        [[nodiscard]] static PaintCmd MakeLine(ImVec2 start, ImVec2 end, LineStyle style);
        [[nodiscard]] static PaintCmd MakePath(std::vector<ImVec2> points, bool closed, uint32_t fill, LineStyle outline);
        [[nodiscard]] static PaintCmd MakeRect(const ImRect& rect, float cornerRadius, uint32_t fill, LineStyle outline = {});
        [[nodiscard]] static PaintCmd MakeText(ImVec2 pos, std::string text, TextStyle style, uint32_t color,
            Align align = Align::Min, float wrapWidth = FLT_MAX);
        [[nodiscard]] static PaintCmd MakeTriangles(Triangles triangles);
    };

    using ClippedPaintCmd = std::pair<ImRect, PaintCmd>;
    using PaintBatches = std::vector<std::pair<ImRect, Triangles>>;

    // Paint commands of one frame, grouped per layer in insertion order
    struct GraphicLayers
    {
        std::vector<ClippedPaintCmd>& List(Layer layer);
        void Push(Layer layer, const ImRect& clipRect, PaintCmd cmd);

        // Consumes every layer: those in order first, then the debug layer, even when order
        // lists it elsewhere. Layers absent from order are discarded.
        [[nodiscard]] std::vector<ClippedPaintCmd> Drain(const std::vector<Layer>& order);

        void Clear() { _layers.clear(); }
        bool Empty() const;
        size_t Count() const;

    private:

        std::unordered_map<Layer, std::vector<ClippedPaintCmd>, LayerHasher> _layers;
    };

    struct PaintOptions
    {
        bool antiAlias = true;
        float aaSize = 1.f; // Width of the anti-aliasing fringe in points, set every frame
        bool debugPaintClipRects = false;
    };

    struct PaintStats
    {
        int32_t batches = 0;
        int32_t primitives = 0;
        int32_t vertices = 0;
        int32_t triangles = 0;
    };

    struct ITessellator
    {
        virtual PaintBatches Tessellate(const PaintOptions& options, const Fonts& fonts,
            const std::vector<ClippedPaintCmd>& commands) = 0;
    };
}
