#pragma once

#include "config.h"
#include "utils.h"

#include <string_view>
#include <optional>
#include <tuple>
#include <cfloat>
#include <cmath>

namespace ember
{
    // =============================================================================================
    // COLORS
    // =============================================================================================

    [[nodiscard]] inline constexpr uint32_t ToRGBA(int r, int g, int b, int a = 255)
    {
        return (((uint32_t)(a) << 24) |
            ((uint32_t)(b) << 16) |
            ((uint32_t)(g) << 8) |
            ((uint32_t)(r) << 0));
    }

    [[nodiscard]] inline constexpr std::tuple<int, int, int, int> DecomposeColor(uint32_t color)
    {
        return { color & 0xff, (color & 0xff00) >> 8, (color & 0xff0000) >> 16, (color & 0xff000000) >> 24 };
    }

    [[nodiscard]] inline constexpr uint32_t SetAlpha(uint32_t rgba, int a)
    {
        auto [r, g, b, _] = DecomposeColor(rgba);
        return ToRGBA(r, g, b, a);
    }

    [[nodiscard]] inline constexpr uint32_t Gray(int luminance, int a = 255)
    {
        return ToRGBA(luminance, luminance, luminance, a);
    }

    inline bool IsColorVisible(uint32_t color)
    {
        return (color & 0xFF000000) != 0;
    }

    constexpr uint32_t ColorRed = ToRGBA(255, 0, 0);
    constexpr uint32_t ColorYellow = ToRGBA(255, 255, 0);
    constexpr uint32_t ColorWhite = ToRGBA(255, 255, 255);
    constexpr uint32_t ColorBlack = ToRGBA(0, 0, 0);
    constexpr uint32_t ColorTransparent = ToRGBA(0, 0, 0, 0);

    // =============================================================================================
    // GEOMETRY
    // =============================================================================================

    [[nodiscard]] inline ImRect RectFromMinSize(ImVec2 min, ImVec2 size)
    {
        return ImRect{ min, min + size };
    }

    [[nodiscard]] inline ImRect RectFromCenterSize(ImVec2 center, ImVec2 size)
    {
        return ImRect{ center - size * 0.5f, center + size * 0.5f };
    }

    [[nodiscard]] inline ImRect Expanded(ImRect rect, ImVec2 amount)
    {
        rect.Expand(amount);
        return rect;
    }

    [[nodiscard]] inline ImRect Expanded(ImRect rect, float amount)
    {
        rect.Expand(amount);
        return rect;
    }

    // Unlike ImRect::Contains, points on the max edges are inside too
    [[nodiscard]] inline bool ContainsInclusive(const ImRect& rect, ImVec2 pos)
    {
        return pos.x >= rect.Min.x && pos.y >= rect.Min.y && pos.x <= rect.Max.x && pos.y <= rect.Max.y;
    }

    [[nodiscard]] inline ImRect EverythingRect()
    {
        return ImRect{ -FLT_MAX, -FLT_MAX, FLT_MAX, FLT_MAX };
    }

    [[nodiscard]] inline float Distance(ImVec2 from, ImVec2 to)
    {
        return std::sqrt(ImLengthSqr(to - from));
    }

    enum class Align
    {
        Min, Center, Max
    };

    // Positions a rect relative to its own min corner, i.e. (Center, Center) centers it on rect.Min
    [[nodiscard]] inline ImRect AlignRect(const ImRect& rect, Align horizontal, Align vertical)
    {
        auto size = rect.GetSize();
        auto min = rect.Min;
        if (horizontal == Align::Center) min.x -= size.x * 0.5f;
        else if (horizontal == Align::Max) min.x -= size.x;
        if (vertical == Align::Center) min.y -= size.y * 0.5f;
        else if (vertical == Align::Max) min.y -= size.y;
        return RectFromMinSize(min, size);
    }

    // =============================================================================================
    // IDENTITY & LAYERING
    // =============================================================================================

    struct Id
    {
        ImGuiID value = 0;

        [[nodiscard]] static Id Make(std::string_view source)
        {
            return Id{ ImHashData(source.data(), source.size(), 0) };
        }

        [[nodiscard]] static Id Make(const char* source)
        {
            return Make(std::string_view{ source });
        }

        [[nodiscard]] static Id Make(int64_t source)
        {
            return Id{ ImHashData(&source, sizeof(source), 0) };
        }

        [[nodiscard]] static Id Make(const void* source)
        {
            return Id{ ImHashData(&source, sizeof(source), 0) };
        }

        [[nodiscard]] static Id Background() { return Make("background"); }
        [[nodiscard]] static Id Debug() { return Make("debug"); }

        // Child ids are seeded with the parent, so equal sources under different parents differ
        [[nodiscard]] Id With(std::string_view child) const
        {
            return Id{ ImHashData(child.data(), child.size(), value) };
        }

        [[nodiscard]] Id With(int64_t child) const
        {
            return Id{ ImHashData(&child, sizeof(child), value) };
        }

        bool operator==(const Id& other) const { return value == other.value; }
        bool operator!=(const Id& other) const { return value != other.value; }
    };

    struct IdHasher
    {
        size_t operator()(const Id& id) const { return (size_t)id.value; }
    };

    enum class Order : int32_t
    {
        Background, // Painted first, beneath everything (the fullscreen ui)
        Middle,     // Windows
        Foreground, // Popups, menus and tooltips
        Debug       // Diagnostic overlays, always painted last
    };

    struct Layer
    {
        Order order = Order::Middle;
        Id id;

        [[nodiscard]] static Layer Background() { return Layer{ Order::Background, Id::Background() }; }
        [[nodiscard]] static Layer Debug() { return Layer{ Order::Debug, Id::Debug() }; }

        bool operator==(const Layer& other) const { return order == other.order && id == other.id; }
        bool operator!=(const Layer& other) const { return !(*this == other); }
    };

    struct LayerHasher
    {
        size_t operator()(const Layer& layer) const
        {
            return ((size_t)layer.order << 32) ^ (size_t)layer.id.value;
        }
    };

    // =============================================================================================
    // INTERACTION
    // =============================================================================================

    enum Sense : int32_t
    {
        Sense_Nothing = 0,
        Sense_Click = 1,
        Sense_Drag = 1 << 1,
        Sense_ClickAndDrag = Sense_Click | Sense_Drag
    };

    struct InteractInfo
    {
        ImRect rect;
        bool hovered = false;
        bool clicked = false;
        bool doubleClicked = false;
        bool active = false; // This widget currently owns the click or the drag
    };

    // =============================================================================================
    // RUNTIME CONFIGURATION
    // =============================================================================================

    struct ITessellator;
    struct PaintStats;

    using TextMeasureFuncT = ImVec2(*)(std::string_view text, void* fontptr, float sz, float wrapWidth);
    using FontLoaderFuncT = void* (*)(std::string_view family, float sizeInPixels);

    struct IFrameLogger
    {
        virtual void EnterFrame(int64_t frame, ImVec2 screen) = 0;
        virtual void ExitFrame(const PaintStats& stats) = 0;
        virtual void Log(const char* fmt, ...) = 0;

        virtual void RegisterId(Id id, std::string_view name, ImVec2 pos) {}
        virtual void IdClash(Id id, std::string_view name, ImVec2 first, ImVec2 second) {}

        // Called with the memory lock held, implementations must not call back into the context
        virtual void OwnershipChanged(std::optional<Id> clickId, std::optional<Id> dragId) {}
    };

    struct UIConfig
    {
        TextMeasureFuncT textMeasure = nullptr;
        FontLoaderFuncT fontLoader = nullptr;
        ITessellator* tessellator = nullptr;
        IFrameLogger* logger = nullptr;

        // Invoked for programming errors, if it returns the process is aborted
        void (*fatal)(std::string_view message) = nullptr;
        void* userData = nullptr;
    };

    extern UIConfig Config;
}
