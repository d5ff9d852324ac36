#include "../core/application_stage.hpp"
#include "test_support.hpp"
#include <cassert>
#include <iostream>

using namespace tile_streamer;

struct fixture_t
{
  std::shared_ptr<test::scripted_tile_source_t> source = std::make_shared<test::scripted_tile_source_t>(8);
  tile_cache_t cache{streamer_config_t{}, source};
  test::recording_render_sink_t sink;

  fixture_t()
  {
    // z17 (400, 400) lies under z15 (100, 100)
    cache.overlays().add({400, 400, "Tower", "Lattice mast"});
  }

  auto fetch_and_apply(std::initializer_list<tile_key_t> keys, double now) -> application::apply_report_t
  {
    for (const auto &key : keys)
    {
      bool dispatched = cache.request(key);
      assert(dispatched);
    }
    cache.pipeline().wait_idle();
    return application::apply_pending(cache, sink, now);
  }
};

void test_plain_image_untouched()
{
  std::cout << "Testing plain tiles keep their pixels..." << std::endl;
  fixture_t f;
  auto report = f.fetch_and_apply({{5000, 5000, 15}}, 3.0);
  assert(report.created == 1 && report.fallbacks == 0 && report.ignored == 0);

  const auto *e = f.sink.find({5000, 5000, 15});
  assert(e && e->kind == test::entity_kind_t::image);
  assert(e->first_pixel_red == 200);
  assert(e->center_pixel_red == 200);
  assert(e->overlay_name.empty());
  assert(e->last_used == 3.0);

  const auto *record = f.cache.registry().find({5000, 5000, 15});
  assert(record && record->state == tile_state_t::active);
  assert(record->last_used == 3.0);
}

void test_overlay_image_treatment()
{
  std::cout << "Testing overlay tiles are darkened and bordered..." << std::endl;
  fixture_t f;
  auto report = f.fetch_and_apply({{400, 400, 17}, {100, 100, 15}}, 1.0);
  assert(report.created == 2);

  // 200 * 0.8 inside, then blended toward the dark border colour at the edge
  const auto *exact = f.sink.find({400, 400, 17});
  assert(exact && exact->kind == test::entity_kind_t::image);
  assert(exact->center_pixel_red >= 159 && exact->center_pixel_red <= 160);
  assert(exact->first_pixel_red >= 86 && exact->first_pixel_red <= 92);
  assert(exact->overlay_name == "Tower");

  const auto *corresponding = f.sink.find({100, 100, 15});
  assert(corresponding && corresponding->center_pixel_red >= 159 && corresponding->center_pixel_red <= 160);
  assert(corresponding->overlay_name.empty());
}

void test_image_treatment_direct()
{
  std::cout << "Testing tile_image_t overlay treatment..." << std::endl;
  tile_image_t image(256, 256);
  image.fill(100, 100, 100, 255);
  image.apply_overlay_treatment();

  // Border is int(256 * 0.03) = 7 clamped to 5 pixels
  assert(image.pixel(128, 128)[0] == 80);
  assert(image.pixel(128, 128)[3] == 255);
  assert(image.pixel(5, 128)[0] == 80);
  assert(image.pixel(4, 128)[0] < 80);
  assert(image.pixel(251, 128)[0] < 80);
  assert(image.pixel(250, 128)[0] == 80);

  tile_image_t empty;
  assert(!empty.is_valid());
  empty.apply_overlay_treatment();
}

void test_fallbacks()
{
  std::cout << "Testing fallback visuals for failed fetches..." << std::endl;
  fixture_t f;
  f.source->fail({400, 400, 17});
  f.source->fail({100, 100, 15});
  f.source->fail({5000, 5000, 15});

  auto report = f.fetch_and_apply({{400, 400, 17}, {100, 100, 15}, {5000, 5000, 15}}, 4.0);
  assert(report.created == 0);
  assert(report.fallbacks == 3);

  const auto *exact = f.sink.find({400, 400, 17});
  assert(exact && exact->kind == test::entity_kind_t::overlay_fallback);
  assert(exact->tint == application::EXACT_OVERLAY_TINT);
  assert(exact->overlay_name == "Tower");

  const auto *corresponding = f.sink.find({100, 100, 15});
  assert(corresponding && corresponding->kind == test::entity_kind_t::overlay_fallback);
  assert(corresponding->tint == application::CORRESPONDING_OVERLAY_TINT);

  const auto *plain = f.sink.find({5000, 5000, 15});
  assert(plain && plain->kind == test::entity_kind_t::fallback);

  // A failed key is resolved, not retried
  for (const tile_key_t key : {tile_key_t{400, 400, 17}, tile_key_t{100, 100, 15}, tile_key_t{5000, 5000, 15}})
  {
    assert(f.cache.registry().state(key) == tile_state_t::active);
    assert(!f.cache.request(key));
    assert(f.source->fetch_count(key) == 1);
  }
}

void test_throwing_source_becomes_fallback()
{
  std::cout << "Testing fetches that throw..." << std::endl;
  fixture_t f;
  const tile_key_t runtime_error{6000, 6000, 15};
  const tile_key_t unknown_throw{6001, 6000, 15};
  f.source->throw_on(runtime_error, true);
  f.source->throw_on(unknown_throw, false);

  auto report = f.fetch_and_apply({runtime_error, unknown_throw}, 2.0);
  assert(report.created == 0 && report.fallbacks == 2 && report.ignored == 0);

  for (const auto &key : {runtime_error, unknown_throw})
  {
    const auto *e = f.sink.find(key);
    assert(e && e->kind == test::entity_kind_t::fallback);
    assert(f.cache.registry().state(key) == tile_state_t::active);
    assert(!f.cache.pipeline().is_outstanding(key));
    assert(f.source->fetch_count(key) == 1);
  }
}

void test_untracked_results_ignored()
{
  std::cout << "Testing late results for untracked keys..." << std::endl;
  fixture_t f;

  tile_image_t image(8, 8);
  image.fill(1, 2, 3, 255);
  bool applied = application::apply_result(f.cache, f.sink, fetch_result_t{{7, 7, 15}, image}, 1.0);
  assert(!applied);
  assert(f.sink.created_count() == 0);
  assert(f.cache.registry().state({7, 7, 15}) == tile_state_t::unrequested);

  // Claim dropped while the fetch was in flight
  assert(f.cache.request({8, 8, 15}));
  f.cache.pipeline().wait_idle();
  assert(f.cache.registry().erase({8, 8, 15}));

  auto report = application::apply_pending(f.cache, f.sink, 2.0);
  assert(report.ignored == 1);
  assert(report.created == 0);
  assert(f.sink.created_count() == 0);
  assert(f.cache.registry().state({8, 8, 15}) == tile_state_t::unrequested);
  assert(!f.cache.is_claimed({8, 8, 15}));
}

void test_second_result_for_active_key_ignored()
{
  std::cout << "Testing a duplicate result does not rebuild the entity..." << std::endl;
  fixture_t f;
  f.fetch_and_apply({{9, 9, 15}}, 1.0);
  assert(f.sink.created_count() == 1);

  tile_image_t image(8, 8);
  image.fill(10, 10, 10, 255);
  assert(!application::apply_result(f.cache, f.sink, fetch_result_t{{9, 9, 15}, image}, 2.0));
  assert(f.sink.created_count() == 1);
  assert(f.cache.registry().find({9, 9, 15})->last_used == 1.0);
}

int main()
{
  test_plain_image_untouched();
  test_overlay_image_treatment();
  test_image_treatment_direct();
  test_fallbacks();
  test_throwing_source_becomes_fallback();
  test_untracked_results_ignored();
  test_second_result_for_active_key_ignored();
  std::cout << "Application Stage Verification Passed" << std::endl;
  return 0;
}
