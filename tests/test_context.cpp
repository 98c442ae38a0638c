#include "TestUtils.h"

using namespace ember;
using namespace ember::test;

TEST_CASE("A frame with nothing in it paints nothing", "[context]")
{
    ConfigScope scope;
    auto context = Context::Create();

    auto ui = BeginFrame(context, MakeInput(std::nullopt, false, 0.0));
    REQUIRE(ui.GetLayer() == Layer::Background());
    REQUIRE(SameRect(ui.Rect(), ImRect{ 0.f, 0.f, ScreenSize.x, ScreenSize.y }));

    auto output = context->EndFrame();
    REQUIRE(output.primitives.empty());
    REQUIRE(output.batches.empty());
    REQUIRE(output.stats.primitives == 0);
    REQUIRE(output.output.cursor == MouseCursor::Default);
    REQUIRE(output.output.copiedText.empty());
    REQUIRE(output.output.openUrl.empty());
    REQUIRE_FALSE(output.output.needsRepaint);
}

TEST_CASE("Every frame starts a new generation of the context", "[context]")
{
    ConfigScope scope;
    auto context = Context::Create();
    auto frames = FramesBegun();

    auto ui = BeginFrame(context, MakeInput(ImVec2{ 1.f, 1.f }, false, 0.0));
    auto previous = context;
    (void)context->EndFrame();

    ui = BeginFrame(context, MakeInput(ImVec2{ 2.f, 2.f }, false, 0.016));
    REQUIRE(context != previous);
    REQUIRE(ui.SharedContext() == context);
    REQUIRE(FramesBegun() == frames + 2);

    // The previous generation is left as it was
    REQUIRE(previous->GetInput().mouse.pos->x == 1.f);
    REQUIRE(context->GetInput().mouse.pos->x == 2.f);
    REQUIRE(context->GetInput().mouse.delta.x == Approx(1.f));
    REQUIRE(context->GetMemory()->areas.Count() == 1u);
}

TEST_CASE("Widgets paint onto their layer in z-order", "[context]")
{
    ConfigScope scope;
    auto context = Context::Create();
    Layer window{ Order::Middle, Id::Make("window") };
    const ImRect windowRect{ 100.f, 100.f, 300.f, 300.f };

    auto ui = BeginFrame(context, MakeInput(std::nullopt, false, 0.0));
    context->GetMemory()->areas.SetState(window, AreaState{ windowRect.Min, windowRect.GetSize() });

    // Submitted out of order
    context->DebugText(ImVec2{ 0.f, 0.f }, "debug");
    Ui windowUi{ context, window, window.id, windowRect };
    windowUi.Add(GuiCmd::MakeButton(InteractInfo{}, ImRect{ 110.f, 110.f, 150.f, 130.f }, "OK"));
    ui.Add(GuiCmd::MakeText(ImVec2{ 10.f, 10.f }, "background", Align::Min, TS_Body));

    auto output = context->EndFrame();
    REQUIRE(output.primitives.size() == 4u);
    REQUIRE(output.primitives[0].second.text == "background");
    REQUIRE(output.primitives[1].second.type == PaintCmdType::Rect);
    REQUIRE(SameRect(output.primitives[1].first, windowRect));
    REQUIRE(output.primitives[2].second.text == "OK");
    REQUIRE(output.primitives[3].second.text == "debug");
    REQUIRE(output.primitives[3].second.params.text.color == ColorYellow);
    REQUIRE(output.stats.primitives == 4);
}

TEST_CASE("Child uis paint within their parent's clip rect", "[context]")
{
    ConfigScope scope;
    auto context = Context::Create();

    auto ui = BeginFrame(context, MakeInput(std::nullopt, false, 0.0));
    ui.SetClipRect(ImRect{ 0.f, 0.f, 100.f, 100.f });
    auto child = ui.ChildUi(ImRect{ 20.f, 20.f, 400.f, 400.f });
    REQUIRE(SameRect(child.ClipRect(), ImRect{ 0.f, 0.f, 100.f, 100.f }));
    REQUIRE(child.GetId() == ui.GetId());
    REQUIRE(ui.ChildUi(child.Rect(), "child").GetId() == ui.MakeChildId("child"));

    child.AddPaintCmd(PaintCmd::MakeCircle(ImVec2{ 30.f, 30.f }, 5.f, ColorWhite));
    context->AddPaintCmd(Layer::Background(), PaintCmd::MakeCircle(ImVec2{ 30.f, 30.f }, 5.f, ColorWhite));

    auto output = context->EndFrame();
    REQUIRE(output.primitives.size() == 2u);
    REQUIRE(SameRect(output.primitives[0].first, ImRect{ 0.f, 0.f, 100.f, 100.f }));
    REQUIRE(SameRect(output.primitives[1].first, EverythingRect()));
}

TEST_CASE("Output requests last for one frame", "[context]")
{
    ConfigScope scope;
    auto context = Context::Create();

    auto ui = BeginFrame(context, MakeInput(std::nullopt, false, 0.0));
    ui.SetCursor(MouseCursor::PointingHand);
    ui.CopyText("copied");
    ui.OpenUrl("https://example.com");
    ui.RequestRepaint();

    auto output = context->EndFrame();
    REQUIRE(output.output.cursor == MouseCursor::PointingHand);
    REQUIRE(output.output.copiedText == "copied");
    REQUIRE(output.output.openUrl == "https://example.com");
    REQUIRE(output.output.needsRepaint);

    ui = BeginFrame(context, MakeInput(std::nullopt, false, 0.016));
    output = context->EndFrame();
    REQUIRE(output.output.cursor == MouseCursor::Default);
    REQUIRE(output.output.copiedText.empty());
    REQUIRE_FALSE(output.output.needsRepaint);
}

TEST_CASE("Primitives are tessellated when a tessellator is installed", "[context]")
{
    ConfigScope scope;
    RecordingLogger logger;
    CountingTessellator tessellator;
    Config.logger = &logger;
    Config.tessellator = &tessellator;

    auto context = Context::Create();
    auto ui = BeginFrame(context, MakeInput(std::nullopt, false, 0.0));
    ui.Add(GuiCmd::MakeButton(InteractInfo{}, ImRect{ 10.f, 10.f, 50.f, 30.f }, "OK"));

    auto output = context->EndFrame();
    REQUIRE(tessellator.calls == 1);
    REQUIRE(output.batches.size() == 2u);
    REQUIRE(output.stats.batches == 2);
    REQUIRE(output.stats.vertices == 6);
    REQUIRE(output.stats.triangles == 2);
    REQUIRE(context->LastPaintStats().vertices == 6);

    REQUIRE(logger.framesEntered == 1);
    REQUIRE(logger.framesExited == 1);
}

TEST_CASE("Anti-aliasing fringe follows the scale factor", "[context]")
{
    struct OptionsTessellator : ITessellator
    {
        PaintOptions seen;

        PaintBatches Tessellate(const PaintOptions& options, const Fonts&,
            const std::vector<ClippedPaintCmd>&) override
        {
            seen = options;
            return {};
        }
    };

    ConfigScope scope;
    OptionsTessellator tessellator;
    Config.tessellator = &tessellator;

    auto context = Context::Create();
    auto input = MakeInput(std::nullopt, false, 0.0);
    input.pixelsPerPoint = 2.f;

    auto ui = BeginFrame(context, input);
    REQUIRE(context->PixelsPerPoint() == 2.f);
    REQUIRE(context->RoundToPixel(1.3f) == Approx(1.5f));
    (void)context->EndFrame();
    REQUIRE(tessellator.seen.aaSize == Approx(0.75f));
    REQUIRE(tessellator.seen.antiAlias);
}

TEST_CASE("Locking the same state twice is a fatal error", "[context]")
{
    ConfigScope scope;
    auto context = Context::Create();
    auto ui = BeginFrame(context, MakeInput(std::nullopt, false, 0.0));

    {
        auto memory = context->GetMemory();
        REQUIRE_THROWS_AS(context->GetMemory(), FatalErrorException);
    }

    // Released again once the guard is gone
    REQUIRE(context->GetMemory()->areas.Count() == 1u);
}

TEST_CASE("Forgetting memory drops every area", "[context]")
{
    ConfigScope scope;
    auto context = Context::Create();
    auto ui = BeginFrame(context, MakeInput(std::nullopt, false, 0.0));
    context->GetMemory()->areas.SetState(Layer{ Order::Middle, Id::Make("window") }, AreaState{});

    context->ResetMemory();
    REQUIRE(context->GetMemory()->areas.Count() == 0u);
    REQUIRE(context->EndFrame().primitives.empty());
}

TEST_CASE("Floating text is aligned around its position", "[context]")
{
    ConfigScope scope;
    auto context = Context::Create();
    auto ui = BeginFrame(context, MakeInput(std::nullopt, false, 0.0));

    auto rect = context->FloatingText(Layer::Background(), ImVec2{ 100.f, 100.f }, "abcd", TS_Body,
        Align::Center, Align::Max);
    REQUIRE(rect.Min.x == Approx(86.f));
    REQUIRE(rect.Min.y == Approx(86.f));
    REQUIRE(rect.GetWidth() == Approx(28.f));

    context->DebugRect(ImRect{ 0.f, 0.f, 10.f, 10.f }, ColorRed, "area");
    auto output = context->EndFrame();
    REQUIRE(output.primitives.size() == 3u);
    REQUIRE(output.primitives[0].second.params.text.color == context->GetStyle().textColor);
    REQUIRE(output.primitives[1].second.params.rect.outline.color == ColorRed);
    REQUIRE(output.primitives[2].second.text.find("area") == 0u);
}
