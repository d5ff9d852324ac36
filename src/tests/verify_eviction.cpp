#include "../core/application_stage.hpp"
#include "../core/eviction.hpp"
#include "../core/tile_streamer.hpp"
#include "test_support.hpp"
#include <algorithm>
#include <cassert>
#include <iostream>

using namespace tile_streamer;

const tile_key_t PLAIN_A{5000, 5000, 15};
const tile_key_t PLAIN_B{5001, 5000, 15};
const tile_key_t EXACT{400, 400, 17};
const tile_key_t CORRESPONDING{100, 100, 15};

void load(tile_cache_t &cache, render_sink_t &sink, std::initializer_list<tile_key_t> keys, double now)
{
  for (const auto &key : keys)
    cache.request(key);
  cache.pipeline().wait_idle();
  auto report = application::apply_pending(cache, sink, now);
  assert(report.created == keys.size());
}

bool is_destroyed(const test::recording_render_sink_t &sink, const tile_key_t &key)
{
  const auto &handles = sink.destroyed();
  return std::any_of(handles.begin(), handles.end(), [&](entity_handle_t h) { return sink.entity(h).key == key; });
}

void test_timeouts()
{
  std::cout << "Testing per-class timeouts..." << std::endl;
  streamer_config_t config;
  assert(eviction::timeout_for(config, overlay_class_t::exact) == 180.0);
  assert(eviction::timeout_for(config, overlay_class_t::corresponding) == 90.0);
  assert(eviction::timeout_for(config, overlay_class_t::none) == 45.0);
}

void test_sweep_evicts_expired_tiles()
{
  std::cout << "Testing sweep eviction..." << std::endl;
  auto source = std::make_shared<test::scripted_tile_source_t>();
  tile_cache_t cache(streamer_config_t{}, source);
  cache.overlays().add({400, 400, "Tower", ""});
  test::recording_render_sink_t sink;

  load(cache, sink, {PLAIN_A, PLAIN_B, EXACT, CORRESPONDING}, 0.0);
  cache.registry().touch(PLAIN_B, 2.0);

  // A is 46s old, B is 44s old
  auto report = eviction::sweep(cache, sink, 46.0);
  assert(report.ran);
  assert(report.evicted == 1);
  assert(cache.registry().state(PLAIN_A) == tile_state_t::unrequested);
  assert(is_destroyed(sink, PLAIN_A));
  assert(cache.registry().state(PLAIN_B) == tile_state_t::active);
  assert(cache.registry().state(CORRESPONDING) == tile_state_t::active);

  // Corresponding overlay tiles last 90s
  report = eviction::sweep(cache, sink, 89.0);
  assert(report.evicted == 1);
  assert(cache.registry().state(PLAIN_B) == tile_state_t::unrequested);
  assert(cache.registry().state(CORRESPONDING) == tile_state_t::active);

  report = eviction::sweep(cache, sink, 91.0);
  assert(report.evicted == 1);
  assert(cache.registry().state(CORRESPONDING) == tile_state_t::unrequested);

  // Exact overlay tiles are never evicted
  report = eviction::sweep(cache, sink, 100000.0);
  assert(report.evicted == 0);
  assert(cache.registry().state(EXACT) == tile_state_t::active);
  assert(!is_destroyed(sink, EXACT));

  // An evicted key can be requested again
  assert(cache.request(PLAIN_A));
  cache.pipeline().wait_idle();
  assert(source->fetch_count(PLAIN_A) == 2);
}

void test_sweep_throttle()
{
  std::cout << "Testing sweep throttle..." << std::endl;
  streamer_config_t config;
  assert(eviction::is_sweep_due(config, 0.0));
  assert(eviction::is_sweep_due(config, 5.0));
  assert(eviction::is_sweep_due(config, 10.04));
  assert(!eviction::is_sweep_due(config, 2.5));
  assert(!eviction::is_sweep_due(config, 5.1));
  assert(!eviction::is_sweep_due(config, 9.9));

  auto source = std::make_shared<test::scripted_tile_source_t>();
  tile_cache_t cache(config, source);
  test::recording_render_sink_t sink;
  load(cache, sink, {PLAIN_A}, 0.0);

  // Expired from t=46 on, but the next sweep only comes at t=50
  for (int second = 1; second < 50; second++)
  {
    auto report = eviction::cleanup_old_tiles(cache, sink, second, 1.0);
    assert(report.ran == (second % 5 == 0));
    assert(report.evicted == 0);
    assert(cache.registry().state(PLAIN_A) == tile_state_t::active);
  }

  auto report = eviction::cleanup_old_tiles(cache, sink, 50.0, 1.0);
  assert(report.ran);
  assert(report.evicted == 1);
  assert(cache.get_total_time() == 50.0);
}

void test_visibility_refresh()
{
  std::cout << "Testing recency refresh near the camera..." << std::endl;
  auto source = std::make_shared<test::scripted_tile_source_t>();
  tile_cache_t cache(streamer_config_t{}, source);
  cache.overlays().add({400, 400, "Tower", ""});
  test::recording_render_sink_t sink;

  const tile_key_t exact{400, 400, 17};
  const tile_key_t plain{480, 400, 17};
  const tile_key_t far{5000, 5000, 15};
  load(cache, sink, {exact, plain, far}, 0.0);

  // 40 units across and 10 up from both z17 tile centres: about 41.2
  camera_state_t camera;
  camera.position = {440.5, 10.0, 400.5};

  auto touched = eviction::update_visible_tiles(cache, camera, 7.0);
  assert(touched == 1);
  assert(cache.registry().find(exact)->last_used == 7.0);
  assert(cache.registry().find(plain)->last_used == 0.0);
  assert(cache.registry().find(far)->last_used == 0.0);

  // Right over the plain tile
  camera.position = {480.5, 10.0, 400.5};
  touched = eviction::update_visible_tiles(cache, camera, 8.0);
  assert(touched == 1);
  assert(cache.registry().find(plain)->last_used == 8.0);
  assert(cache.registry().find(exact)->last_used == 7.0);
}

void test_prune_stale_claims()
{
  std::cout << "Testing stale claim pruning..." << std::endl;
  auto source = std::make_shared<test::gated_tile_source_t>();
  tile_cache_t cache(streamer_config_t{}, source);
  cache.overlays().add({600, 600, "Dish", ""});
  test::recording_render_sink_t sink;

  const tile_key_t in_flight{2, 2, 15};
  const tile_key_t overlay{600, 600, 17};
  const tile_key_t bare{1, 1, 15};
  assert(cache.request(in_flight));
  assert(cache.request(overlay));
  assert(cache.registry().mark_requested(bare));

  auto report = eviction::sweep(cache, sink, 1.0);
  assert(report.pruned == 2);
  assert(cache.registry().state(in_flight) == tile_state_t::unrequested);
  assert(cache.registry().state(bare) == tile_state_t::unrequested);
  assert(cache.registry().state(overlay) == tile_state_t::requested);

  // The fetch is still running, so the key is not dispatched twice
  assert(cache.is_claimed(in_flight));
  assert(!cache.request(in_flight));
  assert(!cache.is_claimed(bare));

  source->release();
  cache.pipeline().wait_idle();
  auto applied = application::apply_pending(cache, sink, 1.0);
  assert(applied.ignored == 1);
  assert(applied.created == 1);
  assert(cache.registry().state(overlay) == tile_state_t::active);
  assert(cache.registry().state(in_flight) == tile_state_t::unrequested);
  assert(sink.find(in_flight) == nullptr);
  assert(!cache.is_claimed(in_flight));

  // Free to be requested again once the late result is gone
  assert(cache.request(in_flight));
  cache.pipeline().wait_idle();
  assert(application::apply_pending(cache, sink, 2.0).created == 1);
  assert(cache.registry().state(in_flight) == tile_state_t::active);
}

void test_tick_without_camera_still_sweeps()
{
  std::cout << "Testing cleanup runs without a camera..." << std::endl;
  auto source = std::make_shared<test::scripted_tile_source_t>();
  test::recording_render_sink_t sink;
  streamer_config_t config;
  tile_streamer_t streamer(config, source, sink);

  auto camera = test::camera_over_tile(100, 100, 15, 100.0, config.world_size);
  // Off the 5s boundary so nothing in flight is pruned
  auto opening = streamer.tick(camera, 0.0, 1.0);
  assert(!opening.sweep.ran);
  streamer.wait_for_fetches();
  auto first = streamer.tick(std::nullopt, 0.0, 1.0);
  assert(!first.camera_present);
  assert(!first.sweep.ran);
  size_t active = streamer.cache().registry().active_count();
  assert(active == 10);

  // Counter reaches 5s on this tick, every tile is 60s stale
  auto later = streamer.tick(std::nullopt, 60.0, 3.0);
  assert(later.sweep.ran);
  assert(later.sweep.evicted == active);
  assert(streamer.cache().registry().active_count() == 0);
}

int main()
{
  test_timeouts();
  test_sweep_evicts_expired_tiles();
  test_sweep_throttle();
  test_visibility_refresh();
  test_prune_stale_claims();
  test_tick_without_camera_still_sweeps();
  std::cout << "Eviction Verification Passed" << std::endl;
  return 0;
}
