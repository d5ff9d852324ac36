#pragma once

#include "core/tile_image.hpp"
#include "core/tile_key.hpp"
#include <mutex>
#include <optional>
#include <vector>

namespace tile_streamer
{

// Outcome of one fetch; an empty image asks for a fallback visual
struct fetch_result_t
{
  tile_key_t key;
  std::optional<tile_image_t> image;
};

// The only structure shared between fetch workers and the main loop.
// The lock is held for the append / swap only.
class result_queue_t
{
public:
  auto push(fetch_result_t result) -> void;

  // Takes everything queued so far, in arrival order
  auto drain() -> std::vector<fetch_result_t>;

private:
  std::mutex m_mutex;
  std::vector<fetch_result_t> m_results;
};

} // namespace tile_streamer
