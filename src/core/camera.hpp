#pragma once

#include <cmath>

namespace tile_streamer
{

struct vec3_t
{
  double x = 0.0;
  double y = 0.0;
  double z = 0.0;

  auto operator-(const vec3_t &o) const -> vec3_t
  {
    return {x - o.x, y - o.y, z - o.z};
  }

  auto dot(const vec3_t &o) const -> double
  {
    return x * o.x + y * o.y + z * o.z;
  }

  auto length() const -> double
  {
    return std::sqrt(dot(*this));
  }

  auto distance(const vec3_t &o) const -> double
  {
    return (*this - o).length();
  }

  // Zero vector stays zero
  auto normalized() const -> vec3_t
  {
    double len = length();
    if (len <= 0.0)
      return {};
    return {x / len, y / len, z / len};
  }
};

// Camera transform supplied by the host each tick.
// Render space: x east, z south, y altitude.
struct camera_state_t
{
  vec3_t position;
  vec3_t forward{0.0, -1.0, 0.0};
};

} // namespace tile_streamer
