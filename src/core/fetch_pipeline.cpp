#include "core/fetch_pipeline.hpp"
#include "core/log.hpp"
#include <chrono>
#include <exception>

namespace tile_streamer
{

fetch_pipeline_t::fetch_pipeline_t(std::shared_ptr<tile_source_t> source, bool debug)
    : m_source(std::move(source)), m_results(std::make_shared<result_queue_t>()), m_debug(debug)
{
}

fetch_pipeline_t::~fetch_pipeline_t()
{
  // Fetch tasks are not cancellable, wait for the stragglers
  wait_idle();
}

auto fetch_pipeline_t::dispatch(const tile_key_t &key) -> void
{
  m_outstanding.insert(key);
  m_dispatched++;

  auto source = m_source;
  auto results = m_results;
  bool debug = m_debug;

  m_tasks.push_back(std::async(std::launch::async,
                               [source, results, key, debug]()
                               {
                                 std::optional<tile_image_t> image;
                                 try
                                 {
                                   image = source->fetch(key);
                                 }
                                 catch (const std::exception &e)
                                 {
                                   logging::warn("Tile {} fetch threw: {}", key.to_string(), e.what());
                                   image.reset();
                                 }
                                 catch (...)
                                 {
                                   logging::warn("Tile {} fetch threw an unknown exception", key.to_string());
                                   image.reset();
                                 }

                                 if (image)
                                   logging::debug(debug, "Loaded tile {}", key.to_string());
                                 else
                                   logging::debug(debug, "Failed to load tile {} - using fallback", key.to_string());

                                 results->push({key, std::move(image)});
                               }));
}

auto fetch_pipeline_t::is_outstanding(const tile_key_t &key) const -> bool
{
  return m_outstanding.contains(key);
}

auto fetch_pipeline_t::outstanding_count() const -> size_t
{
  return m_outstanding.size();
}

auto fetch_pipeline_t::dispatched_count() const -> uint64_t
{
  return m_dispatched;
}

auto fetch_pipeline_t::reap() -> void
{
  std::erase_if(m_tasks, [](std::future<void> &task)
                { return !task.valid() || task.wait_for(std::chrono::seconds(0)) == std::future_status::ready; });
}

auto fetch_pipeline_t::drain_results() -> std::vector<fetch_result_t>
{
  auto drained = m_results->drain();
  for (const auto &result : drained)
  {
    m_outstanding.erase(result.key);
  }
  return drained;
}

auto fetch_pipeline_t::wait_idle() -> void
{
  for (auto &task : m_tasks)
  {
    if (task.valid())
      task.wait();
  }
  m_tasks.clear();
}

} // namespace tile_streamer
