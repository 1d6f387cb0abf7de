#pragma once

#include "debug/Log.hpp"
#include "includes.hpp"
#include "helpers/Monitor.hpp"
#include "helpers/Color.hpp"
#include "clipboard/Clipboard.hpp"
#include "notify/Notify.hpp"

#ifndef HYPRSNAP_VERSION
#define HYPRSNAP_VERSION "?"
#endif

// git stuff
#ifndef GIT_COMMIT_HASH
#define GIT_COMMIT_HASH "?"
#endif
#ifndef GIT_BRANCH
#define GIT_BRANCH "?"
#endif

#include <sys/types.h>

#include <hyprutils/math/Vector2D.hpp>
using namespace Hyprutils::Math;

// Preview placement, in logical pixels. The gap is measured from the edge of
// the captured block so the preview never shows up in its own capture.
constexpr double PREVIEW_CURSOR_GAP  = 24.0;
constexpr double PREVIEW_PADDING     = 6.0;
constexpr double PREVIEW_CORNER      = 8.0;
constexpr double PREVIEW_LABEL_H     = 28.0;

// Frame around the preview, in UI pixels
constexpr double RING_BORDER_PX    = 2.0;
constexpr double RING_SHADOW_PX    = 4.0;
constexpr double RING_SHADOW_ALPHA = 0.25;

// arrow keys move the pick point by this many device pixels, shift for the big step
constexpr double NUDGE_STEP     = 1.0;
constexpr double NUDGE_STEP_BIG = 8.0;

// how long the tick thread waits for the compositor to deliver a frame
constexpr int CAPTURE_TIMEOUT_MS = 500;
