#pragma once

#include "core/render_sink.hpp"
#include "core/tile_cache.hpp"

namespace tile_streamer
{
namespace application
{

constexpr float EXACT_OVERLAY_TINT = 0.7f;
constexpr float CORRESPONDING_OVERLAY_TINT = 0.5f;

struct apply_report_t
{
  size_t created = 0;   // entities built from imagery
  size_t fallbacks = 0; // placeholder entities
  size_t ignored = 0;   // results for keys nobody is waiting on
};

// Turns one fetch result into an active tile. Returns false when the key is
// no longer tracked as requested and the result was dropped.
auto apply_result(tile_cache_t &cache, render_sink_t &sink, fetch_result_t result, double now) -> bool;

// Drains every completed fetch and applies it in arrival order
auto apply_pending(tile_cache_t &cache, render_sink_t &sink, double now) -> apply_report_t;

} // namespace application
} // namespace tile_streamer
