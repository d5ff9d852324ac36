#pragma once

#include "core/config.hpp"
#include "core/tile_source.hpp"
#include <string>

namespace tile_streamer
{

// Downloads slippy-map tiles over HTTP and decodes them
class http_tile_source_t : public tile_source_t
{
public:
  explicit http_tile_source_t(source_config_t config, bool debug = false);
  ~http_tile_source_t() override;

  auto fetch(const tile_key_t &key) -> std::optional<tile_image_t> override;
  auto get_name() const -> const char * override;

  auto make_url(const tile_key_t &key) const -> std::string;

private:
  source_config_t m_config;
  bool m_debug;
};

} // namespace tile_streamer
