#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace tile_streamer
{

// Decoded tile imagery, always RGBA8
class tile_image_t
{
public:
  tile_image_t() = default;
  tile_image_t(int width, int height);

  // Load from raw image data (png/jpg)
  auto load_from_memory(const unsigned char *data, size_t size) -> bool;

  auto is_valid() const -> bool;
  auto get_width() const -> int;
  auto get_height() const -> int;

  auto get_pixels() const -> const std::vector<uint8_t> &;
  auto pixel(int x, int y) -> uint8_t *;
  auto pixel(int x, int y) const -> const uint8_t *;

  auto fill(uint8_t r, uint8_t g, uint8_t b, uint8_t a) -> void;

  // Persistent-overlay look: every RGB channel darkened by 20%, then a
  // dark semi-transparent border 3% of the width wide (1 to 5 px) is blended in.
  // Alpha is left untouched.
  auto apply_overlay_treatment() -> void;

private:
  int m_width = 0;
  int m_height = 0;
  std::vector<uint8_t> m_pixels;
};

} // namespace tile_streamer
