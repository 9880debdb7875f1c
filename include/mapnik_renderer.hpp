#ifndef TESSERA_MAPNIK_RENDERER_HPP
#define TESSERA_MAPNIK_RENDERER_HPP

#include "tile_renderer.hpp"

#include <string>
#include <mapnik/map.hpp>
#include <mapnik/projection.hpp>
#include <mapnik/proj_transform.hpp>

namespace tessera {

// the spatial reference system which tile boxes are computed in.
extern const char *const LONGLAT_PROJ;

struct mapnik_renderer_options {
  // mapnik XML style file.
  std::string map_file;
  // width and height of each tile image, in pixels.
  unsigned int tile_size;
  // one of jpg, png, png8, png24, png32, png256 or webp.
  std::string format;
  // minimum number of pixels to render around the tile, so that
  // labels and symbols crossing the edge aren't clipped.
  int min_buffer_size;
};

// the string passed to mapnik::save_to_file to get the encoding
// wanted for each format.
std::string mapnik_image_type(const std::string &format);

/* Renders tiles with Mapnik's AGG renderer.
 *
 * The style is loaded once on construction, along with the
 * transform from LONGLAT_PROJ to the map's own SRS.
 */
class mapnik_renderer : public tile_renderer {
public:
  explicit mapnik_renderer(const mapnik_renderer_options &options);
  virtual ~mapnik_renderer();

  virtual bounding_box forward(const bounding_box &lonlat) const;
  virtual void render(const bounding_box &box, const std::string &path);
  virtual double scale_denominator() const;

private:
  const mapnik_renderer_options m_options;
  const std::string m_image_type;
  mapnik::Map m_map;
  // the transform refers to these, so they must be declared
  // before it.
  mapnik::projection m_lonlat_proj, m_map_proj;
  mapnik::proj_transform m_transform;
};

/* Creates a `mapnik_renderer` for each worker. Fonts and input
 * plugins are registered once, when the factory is created.
 */
class mapnik_renderer_factory : public renderer_factory {
public:
  mapnik_renderer_factory(const mapnik_renderer_options &options,
                          const std::string &fonts_dir,
                          const std::string &input_plugins_dir);
  virtual ~mapnik_renderer_factory();

  virtual std::unique_ptr<tile_renderer> make_renderer();

private:
  const mapnik_renderer_options m_options;
};

} // namespace tessera

#endif // TESSERA_MAPNIK_RENDERER_HPP
