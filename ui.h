#pragma once

#include "context.h"

#include <memory>
#include <string_view>

namespace ember
{
    // A region of the screen widgets are placed into. Everything painted through it ends up
    // on its layer, clipped to its clip rect.
    struct Ui
    {
        Ui(std::shared_ptr<Context> context, Layer layer, Id id, const ImRect& rect);

        Context& Ctx() const { return *_context; }
        const std::shared_ptr<Context>& SharedContext() const { return _context; }
        const InputState& GetInput() const { return _context->GetInput(); }

        Layer GetLayer() const { return _layer; }
        Id GetId() const { return _id; }
        const ImRect& Rect() const { return _rect; }
        const ImRect& ClipRect() const { return _clipRect; }
        void SetClipRect(const ImRect& clipRect) { _clipRect = clipRect; }

        InteractInfo Interact(const ImRect& rect, std::optional<Id> id, int32_t sense);

        // Only tells whether rect is hovered, never claims or changes anything
        InteractInfo InteractHover(const ImRect& rect);

        Id MakeUniqueId(std::string_view source, ImVec2 pos);
        Id MakeUniqueId(int64_t source, ImVec2 pos);
        Id MakeChildId(std::string_view source) const { return _id.With(source); }

        void AddPaintCmd(PaintCmd cmd);
        void Add(const GuiCmd& cmd);

        [[nodiscard]] Ui ChildUi(const ImRect& rect) const;
        [[nodiscard]] Ui ChildUi(const ImRect& rect, std::string_view idSource) const;

        void SetCursor(MouseCursor cursor);
        void CopyText(std::string_view text);
        void OpenUrl(std::string_view url);
        void RequestRepaint();

    private:

        std::shared_ptr<Context> _context;
        Layer _layer;
        Id _id;
        ImRect _rect;
        ImRect _clipRect;
    };
}
