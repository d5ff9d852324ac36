#include "core/result_queue.hpp"

namespace tile_streamer
{

auto result_queue_t::push(fetch_result_t result) -> void
{
  std::lock_guard<std::mutex> lock(m_mutex);
  m_results.push_back(std::move(result));
}

auto result_queue_t::drain() -> std::vector<fetch_result_t>
{
  std::vector<fetch_result_t> out;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    out.swap(m_results);
  }
  return out;
}

} // namespace tile_streamer
