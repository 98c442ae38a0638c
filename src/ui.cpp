#include "ui.h"

#include <cstdio>

namespace ember
{
    Ui::Ui(std::shared_ptr<Context> context, Layer layer, Id id, const ImRect& rect)
        : _context{ std::move(context) }, _layer{ layer }, _id{ id }, _rect{ rect }, _clipRect{ rect }
    {}

    InteractInfo Ui::Interact(const ImRect& rect, std::optional<Id> id, int32_t sense)
    {
        return _context->Interact(_layer, _clipRect, rect, id, sense);
    }

    InteractInfo Ui::InteractHover(const ImRect& rect)
    {
        return _context->Interact(_layer, _clipRect, rect, std::nullopt, Sense_Nothing);
    }

    Id Ui::MakeUniqueId(std::string_view source, ImVec2 pos)
    {
        return _context->RegisterUniqueId(_id.With(source), source, pos);
    }

    Id Ui::MakeUniqueId(int64_t source, ImVec2 pos)
    {
        char name[32];
        std::snprintf(name, 32, "%lld", (long long)source);
        return _context->RegisterUniqueId(_id.With(source), name, pos);
    }

    void Ui::AddPaintCmd(PaintCmd cmd)
    {
        _context->GetGraphics()->Push(_layer, _clipRect, std::move(cmd));
    }

    void Ui::Add(const GuiCmd& cmd)
    {
        std::vector<PaintCmd> commands;
        TranslateCommand(commands, _context->GetStyle(), cmd);

        auto graphics = _context->GetGraphics();
        for (auto& command : commands)
            graphics->Push(_layer, _clipRect, std::move(command));
    }

    Ui Ui::ChildUi(const ImRect& rect) const
    {
        Ui child{ _context, _layer, _id, rect };
        child._clipRect = _clipRect;
        return child;
    }

    Ui Ui::ChildUi(const ImRect& rect, std::string_view idSource) const
    {
        Ui child{ _context, _layer, _id.With(idSource), rect };
        child._clipRect = _clipRect;
        return child;
    }

    void Ui::SetCursor(MouseCursor cursor)
    {
        _context->GetOutput()->cursor = cursor;
    }

    void Ui::CopyText(std::string_view text)
    {
        _context->GetOutput()->copiedText = std::string{ text };
    }

    void Ui::OpenUrl(std::string_view url)
    {
        _context->GetOutput()->openUrl = std::string{ url };
    }

    void Ui::RequestRepaint()
    {
        _context->GetOutput()->needsRepaint = true;
    }
}
