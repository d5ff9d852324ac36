#include "../core/geo_math.hpp"
#include "../core/tile_pyramid.hpp"
#include <algorithm>
#include <cassert>
#include <cmath>
#include <iostream>

using namespace tile_streamer;

void test_max_tile_index()
{
  std::cout << "Testing max_tile_index..." << std::endl;
  assert(pyramid::max_tile_index(0) == 0);
  assert(pyramid::max_tile_index(1) == 1);
  assert(pyramid::max_tile_index(15) == 32767);
  assert(pyramid::max_tile_index(18) == 262143);
}

void test_world_to_tile()
{
  std::cout << "Testing world_to_tile..." << std::endl;
  const double world = 131072.0; // 1 unit per tile at z17

  // Tile (100, 100) at z15 spans 4 units per side
  auto [tx, ty] = pyramid::world_to_tile(402.0, 402.0, 15, world);
  assert(tx == 100 && ty == 100);

  auto [ex, ey] = pyramid::world_to_tile(400.0, 403.99, 15, world);
  assert(ex == 100 && ey == 100);

  // Out of range positions are clamped to the pyramid
  auto [cx, cy] = pyramid::world_to_tile(-50.0, world * 2.0, 15, world);
  assert(cx == 0 && cy == pyramid::max_tile_index(15));

  auto center = pyramid::tile_center({100, 100, 15}, world);
  assert(std::abs(center.x - 402.0) < 1e-9);
  assert(std::abs(center.z - 402.0) < 1e-9);
  assert(center.y == 0.0);
}

void test_reproject_coarser_is_many_to_one()
{
  std::cout << "Testing coarser reprojection..." << std::endl;
  auto block = pyramid::reproject({1609, 1601, 18}, 15);
  assert(block.zoom == 15);
  assert(block.tile_count() == 1);
  assert(block.min_x == 201 && block.min_y == 200);

  // Every tile of the 8x8 fine block lands on the same coarse tile
  for (uint32_t x = 1608; x < 1616; x++)
  {
    for (uint32_t y = 1600; y < 1608; y++)
    {
      auto b = pyramid::reproject({x, y, 18}, 15);
      assert(b.min_x == 201 && b.min_y == 200);
    }
  }
}

void test_reproject_finer_is_one_to_block()
{
  std::cout << "Testing finer reprojection..." << std::endl;
  auto block = pyramid::reproject({100, 100, 15}, 17);
  assert(block.zoom == 17);
  assert(block.min_x == 400 && block.max_x == 403);
  assert(block.min_y == 400 && block.max_y == 403);
  assert(block.tile_count() == 16);

  auto keys = pyramid::reproject_keys({3, 5, 2}, 4);
  assert(keys.size() == 16);
  for (const auto &k : keys)
  {
    assert(k.zoom == 4);
    assert(k.x >> 2 == 3 && k.y >> 2 == 5);
  }

  auto same = pyramid::reproject({7, 9, 12}, 12);
  assert(same.tile_count() == 1 && same.min_x == 7 && same.min_y == 9 && same.zoom == 12);
}

void test_round_trip_contains_source_tile()
{
  std::cout << "Testing coarse-then-fine round trip..." << std::endl;
  tile_key_t keys[] = {{0, 0, 10}, {1023, 511, 10}, {12345, 54321, 17}, {77, 3, 7}};
  for (const auto &key : keys)
  {
    for (int target = 0; target <= key.zoom; target++)
    {
      auto coarse = pyramid::reproject(key, target);
      tile_key_t coarse_key{coarse.min_x, coarse.min_y, target};
      auto back = pyramid::reproject(coarse_key, key.zoom);
      assert(back.contains(key));
      assert(back.tile_count() == (uint64_t{1} << (2 * (key.zoom - target))));
    }
  }
}

void test_block_distance()
{
  std::cout << "Testing block distances..." << std::endl;
  pyramid::tile_block_t block{10, 20, 13, 23, 5};
  assert(pyramid::manhattan_distance(block, 11, 21) == 0);
  assert(pyramid::manhattan_distance(block, 8, 21) == 2);
  assert(pyramid::manhattan_distance(block, 15, 26) == 5);

  auto [dx, dy] = pyramid::axis_distance(block, 0, 30);
  assert(dx == 10 && dy == 7);
}

void test_geo_projection()
{
  std::cout << "Testing lat/lon projection..." << std::endl;
  double wx, wy;
  geo::lat_lon_to_world(0.0, 0.0, wx, wy);
  assert(std::abs(wx - 0.5) < 1e-12 && std::abs(wy - 0.5) < 1e-12);

  int tx, ty;
  geo::world_to_tile(wx, wy, 1, tx, ty);
  assert(tx == 1 && ty == 1);

  double lat, lon;
  geo::lat_lon_to_world(51.5, -0.12, wx, wy);
  geo::world_to_lat_lon(wx, wy, lat, lon);
  assert(std::abs(lat - 51.5) < 1e-6 && std::abs(lon + 0.12) < 1e-9);
}

int main()
{
  test_max_tile_index();
  test_world_to_tile();
  test_reproject_coarser_is_many_to_one();
  test_reproject_finer_is_one_to_block();
  test_round_trip_contains_source_tile();
  test_block_distance();
  test_geo_projection();
  std::cout << "Tile Pyramid Verification Passed" << std::endl;
  return 0;
}
