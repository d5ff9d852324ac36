#pragma once

#include "core/result_queue.hpp"
#include "core/tile_source.hpp"
#include <cstdint>
#include <future>
#include <memory>
#include <set>
#include <vector>

namespace tile_streamer
{

// Dispatches tile fetches onto background tasks and collects their results.
// Every method except the result queue internals runs on the main loop.
class fetch_pipeline_t
{
public:
  explicit fetch_pipeline_t(std::shared_ptr<tile_source_t> source, bool debug = false);
  ~fetch_pipeline_t();

  fetch_pipeline_t(const fetch_pipeline_t &) = delete;
  fetch_pipeline_t &operator=(const fetch_pipeline_t &) = delete;

  // Starts a fetch. No retry: a failed fetch comes back as an empty result.
  auto dispatch(const tile_key_t &key) -> void;

  // Dispatched and not yet drained
  auto is_outstanding(const tile_key_t &key) const -> bool;
  auto outstanding_count() const -> size_t;
  auto dispatched_count() const -> uint64_t;

  // Forget finished tasks, never blocks
  auto reap() -> void;

  // Takes all completed results and releases their outstanding marks
  auto drain_results() -> std::vector<fetch_result_t>;

  // Blocks until every task has finished. Not for use inside a tick.
  auto wait_idle() -> void;


private:
  std::shared_ptr<tile_source_t> m_source;
  std::shared_ptr<result_queue_t> m_results;
  std::vector<std::future<void>> m_tasks;
  std::set<tile_key_t> m_outstanding;
  uint64_t m_dispatched = 0;
  bool m_debug;
};

} // namespace tile_streamer
