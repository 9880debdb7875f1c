#include "mapnik_renderer.hpp"

#include <stdexcept>
#include <boost/format.hpp>
#include <boost/filesystem/operations.hpp>

#include <mapnik/agg_renderer.hpp>
#include <mapnik/box2d.hpp>
#include <mapnik/datasource_cache.hpp>
#include <mapnik/font_engine_freetype.hpp>
#include <mapnik/image.hpp>
#include <mapnik/image_util.hpp>
#include <mapnik/load_map.hpp>

namespace bfs = boost::filesystem;

namespace tessera {

const char *const LONGLAT_PROJ = "+proj=longlat +ellps=WGS84 +datum=WGS84 +no_defs";

namespace {

mapnik::Map load_style(const mapnik_renderer_options &options) {
  mapnik::Map map(options.tile_size, options.tile_size);
  map.set_aspect_fix_mode(mapnik::Map::RESPECT);

  // strict, so that errors in the style are reported rather than
  // producing blank tiles.
  mapnik::load_map(map, options.map_file, true);

  return map;
}

} // anonymous namespace

std::string mapnik_image_type(const std::string &format) {
  if (format == "webp") {
    return "webp:lossless=1:quality=100:image_hint=3";

  } else if (format == "jpg") {
    return "jpeg100";

  } else {
    return format + ":z=9:s=rle";
  }
}

mapnik_renderer::mapnik_renderer(const mapnik_renderer_options &options)
  : m_options(options),
    m_image_type(mapnik_image_type(options.format)),
    m_map(load_style(options)),
    m_lonlat_proj(LONGLAT_PROJ),
    m_map_proj(m_map.srs()),
    m_transform(m_lonlat_proj, m_map_proj) {
}

mapnik_renderer::~mapnik_renderer() {
}

bounding_box mapnik_renderer::forward(const bounding_box &lonlat) const {
  mapnik::box2d<double> box(lonlat.west, lonlat.south, lonlat.east, lonlat.north);

  if (!m_transform.forward(box)) {
    throw std::runtime_error((boost::format("Unable to transform %1% into the map's "
                                            "spatial reference system \"%2%\".")
                              % lonlat % m_map.srs()).str());
  }

  return bounding_box(box.minx(), box.miny(), box.maxx(), box.maxy());
}

void mapnik_renderer::render(const bounding_box &box, const std::string &path) {
  m_map.zoom_to_box(mapnik::box2d<double>(box.west, box.south, box.east, box.north));
  if (m_map.buffer_size() < m_options.min_buffer_size) {
    m_map.set_buffer_size(m_options.min_buffer_size);
  }

  mapnik::image_rgba8 image(m_options.tile_size, m_options.tile_size);
  mapnik::agg_renderer<mapnik::image_rgba8> renderer(m_map, image);
  renderer.apply();

  // write to a temporary file first, so that a render which
  // dies part way through doesn't leave a truncated tile which
  // would be skipped next time.
  const std::string partial = path + ".part";
  mapnik::save_to_file(image, partial, m_image_type);
  bfs::rename(partial, path);
}

double mapnik_renderer::scale_denominator() const {
  return m_map.scale_denominator();
}

mapnik_renderer_factory::mapnik_renderer_factory(const mapnik_renderer_options &options,
                                                 const std::string &fonts_dir,
                                                 const std::string &input_plugins_dir)
  : m_options(options) {

  // try to register fonts and input plugins
  mapnik::freetype_engine::register_fonts(fonts_dir);
  mapnik::datasource_cache::instance().register_datasources(input_plugins_dir);
}

mapnik_renderer_factory::~mapnik_renderer_factory() {
}

std::unique_ptr<tile_renderer> mapnik_renderer_factory::make_renderer() {
  return std::unique_ptr<tile_renderer>(new mapnik_renderer(m_options));
}

} // namespace tessera
