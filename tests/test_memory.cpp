#include "TestUtils.h"

using namespace ember;
using namespace ember::test;

namespace
{
    AreaState MakeArea(float x, float y, float w, float h, bool interactable = true)
    {
        return AreaState{ ImVec2{ x, y }, ImVec2{ w, h }, interactable };
    }
}

TEST_CASE("The topmost visible area is hit", "[memory]")
{
    Areas areas;
    Layer lower{ Order::Middle, Id::Make("lower") };
    Layer upper{ Order::Middle, Id::Make("upper") };

    areas.SetState(lower, MakeArea(0.f, 0.f, 100.f, 100.f));
    areas.SetState(upper, MakeArea(50.f, 50.f, 100.f, 100.f));
    REQUIRE(areas.Count() == 2u);

    REQUIRE(areas.LayerAt(ImVec2{ 60.f, 60.f }, 0.f) == upper);
    REQUIRE(areas.LayerAt(ImVec2{ 10.f, 10.f }, 0.f) == lower);
    REQUIRE_FALSE(areas.LayerAt(ImVec2{ 300.f, 300.f }, 0.f).has_value());

    // Edges belong to the area
    REQUIRE(areas.LayerAt(ImVec2{ 150.f, 150.f }, 0.f) == upper);

    SECTION("Raising an area")
    {
        areas.MoveToTop(lower);
        areas.EndFrame();
        REQUIRE(areas.Order().back() == lower);
        REQUIRE(areas.LayerAt(ImVec2{ 60.f, 60.f }, 0.f) == lower);
    }

    SECTION("Tolerance around the edges")
    {
        REQUIRE(areas.LayerAt(ImVec2{ 153.f, 60.f }, 5.f) == upper);
        REQUIRE_FALSE(areas.LayerAt(ImVec2{ 153.f, 60.f }, 0.f).has_value());
        REQUIRE(areas.LayerAt(ImVec2{ 155.f, 155.f }, 5.f) == upper);
    }

    SECTION("Areas not shown for a whole frame are skipped")
    {
        areas.EndFrame();
        areas.SetState(lower, MakeArea(0.f, 0.f, 100.f, 100.f));
        areas.EndFrame();
        REQUIRE_FALSE(areas.IsVisible(upper));
        REQUIRE(areas.LayerAt(ImVec2{ 60.f, 60.f }, 0.f) == lower);
    }
}

TEST_CASE("Areas which are not interactable are never hit", "[memory]")
{
    Areas areas;
    Layer window{ Order::Middle, Id::Make("window") };
    Layer tooltip{ Order::Foreground, Id::Make("tooltip") };

    areas.SetState(window, MakeArea(0.f, 0.f, 100.f, 100.f));
    areas.SetState(tooltip, MakeArea(0.f, 0.f, 50.f, 20.f, false));
    areas.EndFrame();

    REQUIRE(areas.LayerAt(ImVec2{ 10.f, 10.f }, 0.f) == window);
}

TEST_CASE("Area order is sorted by layer order, keeping insertion order within one", "[memory]")
{
    Areas areas;
    Layer popup{ Order::Foreground, Id::Make("popup") };
    Layer first{ Order::Middle, Id::Make("first") };
    Layer second{ Order::Middle, Id::Make("second") };

    areas.SetState(popup, MakeArea(0.f, 0.f, 10.f, 10.f));
    areas.SetState(first, MakeArea(0.f, 0.f, 10.f, 10.f));
    areas.SetState(Layer::Background(), MakeArea(0.f, 0.f, 10.f, 10.f));
    areas.SetState(second, MakeArea(0.f, 0.f, 10.f, 10.f));
    areas.EndFrame();

    const auto& order = areas.Order();
    REQUIRE(order.size() == 4u);
    REQUIRE(order[0] == Layer::Background());
    REQUIRE(order[1] == first);
    REQUIRE(order[2] == second);
    REQUIRE(order[3] == popup);

    // Raised, but still beneath every popup
    areas.MoveToTop(first);
    areas.EndFrame();
    REQUIRE(areas.Order()[2] == first);
    REQUIRE(areas.Order()[3] == popup);
}

TEST_CASE("Updating an area keeps its place", "[memory]")
{
    Areas areas;
    Layer first{ Order::Middle, Id::Make("first") };
    Layer second{ Order::Middle, Id::Make("second") };

    areas.SetState(first, MakeArea(0.f, 0.f, 10.f, 10.f));
    areas.SetState(second, MakeArea(0.f, 0.f, 10.f, 10.f));
    areas.SetState(first, MakeArea(5.f, 5.f, 20.f, 20.f));

    REQUIRE(areas.Order().size() == 2u);
    REQUIRE(areas.Order()[0] == first);
    REQUIRE(areas.Get(first.id)->pos.x == 5.f);
    REQUIRE(areas.Get(Id::Make("missing")) == nullptr);
}

TEST_CASE("Window interactions end with the pointer going up", "[memory]")
{
    Memory memory;
    Layer window{ Order::Middle, Id::Make("window") };
    memory.areas.SetState(window, MakeArea(0.f, 0.f, 100.f, 100.f));

    InputState held;
    held.mouse.down = true;
    held.mouse.pos = ImVec2{ 10.f, 10.f };

    REQUIRE(memory.StartWindowInteraction(window, WindowInteractionType::Resize, ImRect{ 0.f, 0.f, 100.f, 100.f }));
    REQUIRE(memory.interaction.dragId == window.id);
    REQUIRE(memory.windowInteraction->type == WindowInteractionType::Resize);

    memory.BeginFrame(held);
    REQUIRE(memory.windowInteraction.has_value());
    REQUIRE(memory.interaction.dragId == window.id);

    memory.BeginFrame(InputState{});
    REQUIRE_FALSE(memory.windowInteraction.has_value());
    REQUIRE_FALSE(memory.interaction.dragId.has_value());
    REQUIRE_FALSE(memory.interaction.dragIsWindow);
}

TEST_CASE("Window interactions end with the pointer leaving while held", "[memory]")
{
    Memory memory;
    Layer window{ Order::Middle, Id::Make("window") };
    memory.areas.SetState(window, MakeArea(0.f, 0.f, 100.f, 100.f));

    REQUIRE(memory.StartWindowInteraction(window, WindowInteractionType::Drag, ImRect{ 0.f, 0.f, 100.f, 100.f }));

    InputState gone;
    gone.mouse.down = true;

    memory.BeginFrame(gone);
    REQUIRE_FALSE(memory.windowInteraction.has_value());
    REQUIRE_FALSE(memory.interaction.dragId.has_value());
    REQUIRE_FALSE(memory.interaction.dragIsWindow);
}

TEST_CASE("Click ownership ends once the pointer moves away", "[memory]")
{
    Interaction interaction;
    interaction.clickId = Id::Make("button");
    interaction.dragId = Id::Make("button");
    interaction.clickInterest = true;

    MouseInput moved;
    moved.down = true;
    moved.pos = ImVec2{ 40.f, 40.f };
    moved.couldBeClick = false;

    interaction.BeginFrame(moved);
    REQUIRE_FALSE(interaction.clickId.has_value());
    REQUIRE(interaction.dragId.has_value());
    REQUIRE_FALSE(interaction.clickInterest);
}
