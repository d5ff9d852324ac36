#include "core/tile_image.hpp"
#include "core/log.hpp"
#include <algorithm>

// STB Image implementation
#define STB_IMAGE_IMPLEMENTATION
#include "stb_image.h"

namespace tile_streamer
{

constexpr float OVERLAY_DARKEN_FACTOR = 0.2f;
constexpr float OVERLAY_BORDER_FRACTION = 0.03f;
constexpr int OVERLAY_BORDER_MIN = 1;
constexpr int OVERLAY_BORDER_MAX = 5;
constexpr uint8_t OVERLAY_BORDER_COLOR[4] = {40, 40, 40, 150};

tile_image_t::tile_image_t(int width, int height)
    : m_width(width), m_height(height), m_pixels(static_cast<size_t>(width) * height * 4, 0)
{
}

auto tile_image_t::load_from_memory(const unsigned char *data, size_t size) -> bool
{
  int width = 0;
  int height = 0;
  int channels = 0;
  unsigned char *pixel_data = stbi_load_from_memory(data, static_cast<int>(size), &width, &height, &channels,
                                                    4 // Force RGBA
  );

  if (!pixel_data)
  {
    logging::warn("Failed to decode tile image: {}", stbi_failure_reason());
    return false;
  }

  m_width = width;
  m_height = height;
  m_pixels.assign(pixel_data, pixel_data + static_cast<size_t>(width) * height * 4);

  stbi_image_free(pixel_data);
  return true;
}

auto tile_image_t::is_valid() const -> bool
{
  return m_width > 0 && m_height > 0 && m_pixels.size() == static_cast<size_t>(m_width) * m_height * 4;
}

auto tile_image_t::get_width() const -> int
{
  return m_width;
}

auto tile_image_t::get_height() const -> int
{
  return m_height;
}

auto tile_image_t::get_pixels() const -> const std::vector<uint8_t> &
{
  return m_pixels;
}

auto tile_image_t::pixel(int x, int y) -> uint8_t *
{
  return m_pixels.data() + (static_cast<size_t>(y) * m_width + x) * 4;
}

auto tile_image_t::pixel(int x, int y) const -> const uint8_t *
{
  return m_pixels.data() + (static_cast<size_t>(y) * m_width + x) * 4;
}

auto tile_image_t::fill(uint8_t r, uint8_t g, uint8_t b, uint8_t a) -> void
{
  for (size_t i = 0; i + 3 < m_pixels.size(); i += 4)
  {
    m_pixels[i + 0] = r;
    m_pixels[i + 1] = g;
    m_pixels[i + 2] = b;
    m_pixels[i + 3] = a;
  }
}

auto tile_image_t::apply_overlay_treatment() -> void
{
  if (!is_valid())
    return;

  for (size_t i = 0; i + 3 < m_pixels.size(); i += 4)
  {
    for (size_t c = 0; c < 3; c++)
    {
      m_pixels[i + c] = static_cast<uint8_t>(m_pixels[i + c] * (1.0f - OVERLAY_DARKEN_FACTOR));
    }
  }

  int border = static_cast<int>(m_width * OVERLAY_BORDER_FRACTION);
  border = std::clamp(border, OVERLAY_BORDER_MIN, OVERLAY_BORDER_MAX);

  float alpha = OVERLAY_BORDER_COLOR[3] / 255.0f;
  for (int y = 0; y < m_height; y++)
  {
    for (int x = 0; x < m_width; x++)
    {
      bool on_border = x < border || x >= m_width - border || y < border || y >= m_height - border;
      if (!on_border)
        continue;

      uint8_t *p = pixel(x, y);
      for (int c = 0; c < 3; c++)
      {
        p[c] = static_cast<uint8_t>((1.0f - alpha) * p[c] + alpha * OVERLAY_BORDER_COLOR[c]);
      }
    }
  }
}

} // namespace tile_streamer
