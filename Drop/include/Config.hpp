#pragma once

#include "Types.hpp"

#include <string_view>

namespace Drop::Config {

// Size of the bounded pool that materializes promised files.
#ifdef DROP_THREAD_COUNT
static constexpr u32 thread_count = DROP_THREAD_COUNT;
#else
static constexpr u32 thread_count = 4;
#endif

// Reserved prefix of memory-backed item paths. Real paths never start with it.
#ifdef DROP_MEMORY_SCHEME
static constexpr std::string_view memory_scheme = DROP_MEMORY_SCHEME;
#else
static constexpr std::string_view memory_scheme = "memory://";
#endif

// Sub directory of the temp area that receives per-gesture promise folders.
#ifdef DROP_PROMISE_DIRECTORY_NAME
static constexpr std::string_view promise_directory_name =
    DROP_PROMISE_DIRECTORY_NAME;
#else
static constexpr std::string_view promise_directory_name = "Drops";
#endif

static constexpr std::string_view default_mime_type = "application/octet-stream";
static constexpr std::string_view default_item_name = "Dropped.data";

// Hover points arrive in device pixels on Windows and must be divided by the
// device pixel ratio before hit-testing.
#ifdef DROP_SCALE_HOVER_POINTS
static constexpr bool scale_hover_points = DROP_SCALE_HOVER_POINTS;
#elif defined(_WIN32)
static constexpr bool scale_hover_points = true;
#else
static constexpr bool scale_hover_points = false;
#endif

// Native surfaces with a bottom-left origin report y upwards.
#ifdef DROP_FLIP_NATIVE_Y
static constexpr bool flip_native_y = DROP_FLIP_NATIVE_Y;
#else
static constexpr bool flip_native_y = false;
#endif

// GTK reports 'exited' before the drop; these platforms never send 'entered'.
#ifdef DROP_HOVER_WITHOUT_ENTER
static constexpr bool hover_without_enter = DROP_HOVER_WITHOUT_ENTER;
#elif defined(__linux__)
static constexpr bool hover_without_enter = true;
#else
static constexpr bool hover_without_enter = false;
#endif

// GTK ends the hover with 'exited' before the drop arrives, so a drop inside
// a region counts as hovered even though the region is idle again.
#ifdef DROP_EXIT_BEFORE_DROP
static constexpr bool exit_before_drop = DROP_EXIT_BEFORE_DROP;
#elif defined(__linux__)
static constexpr bool exit_before_drop = true;
#else
static constexpr bool exit_before_drop = false;
#endif

} // namespace Drop::Config
