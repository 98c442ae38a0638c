#pragma once

#include <stdint.h>

// Two claims of the same id closer than this (in points) are treated as the same widget
// re-registering itself, anything further apart is reported as a clash
#ifndef EMBER_ID_CLASH_TOLERANCE
#define EMBER_ID_CLASH_TOLERANCE 4.f
#endif

// Pointer movement (in points) after a press beyond which the release no longer counts as a click
#ifndef EMBER_MAX_CLICK_DIST
#define EMBER_MAX_CLICK_DIST 6.f
#endif

// Maximum time (in seconds) between two clicks for the second one to be a double click
#ifndef EMBER_MAX_DOUBLE_CLICK_DELAY
#define EMBER_MAX_DOUBLE_CLICK_DELAY 0.3
#endif

// Frame time used when the platform reports a non-positive or implausibly large delta
#ifndef EMBER_FALLBACK_FRAMETIME
#define EMBER_FALLBACK_FRAMETIME (1.f / 60.f)
#endif

#ifndef EMBER_MAX_FRAMETIME
#define EMBER_MAX_FRAMETIME 0.1f
#endif

// Name of the default font family, redefine if compiling only for specific platforms
#ifndef EMBER_DEFAULT_FONTFAMILY
#define EMBER_DEFAULT_FONTFAMILY "default-font-family"
#endif

// Name of the default monospace font family, used for diagnostic overlays
#ifndef EMBER_MONOSPACE_FONTFAMILY
#define EMBER_MONOSPACE_FONTFAMILY "monospace-family"
#endif

// Size of the buffer used to format fatal error and clash messages
#ifndef EMBER_MESSAGE_BUFSZ
#define EMBER_MESSAGE_BUFSZ 512
#endif

// Number of paint commands reserved per layer at the start of a frame
#ifndef EMBER_LAYER_PREALLOC
#define EMBER_LAYER_PREALLOC 64
#endif

// ImVec2 arithmetic comes from ImGui itself, it has to be requested before the first include
#ifndef IMGUI_DEFINE_MATH_OPERATORS
#define IMGUI_DEFINE_MATH_OPERATORS
#endif
#include <imgui.h>
#include <imgui_internal.h>

#ifdef _DEBUG
#include <cstdio>
#define LOG(FMT, ...) std::fprintf(stderr, FMT, __VA_ARGS__)
#define HIGHLIGHT(FMT, ...) std::fprintf(stderr, "\x1B[93m" FMT "\x1B[0m", __VA_ARGS__)
#define LOGERROR(FMT, ...) std::fprintf(stderr, "\x1B[31m" FMT "\x1B[0m", __VA_ARGS__)
#else
#define LOG(FMT, ...)
#define HIGHLIGHT(FMT, ...)
#define LOGERROR(FMT, ...)
#endif

#define EVERY_NTHFRAME(N, FMT, ...) if (ember::FramesBegun() % N == 0) LOG(FMT, __VA_ARGS__)
