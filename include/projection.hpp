#ifndef TESSERA_PROJECTION_HPP
#define TESSERA_PROJECTION_HPP

#include "geometry.hpp"
#include <vector>

namespace tessera {

/* Converts between longitude / latitude and pixel coordinates
 * in the spherical mercator ("Google") tiling scheme, where
 * zoom level z is a square of tile_size * 2^z pixels.
 *
 * The per-zoom constants are computed once on construction for
 * zoom levels [0, levels) and never modified afterwards.
 */
class google_projection {
public:
  google_projection(unsigned int levels, unsigned int tile_size);

  // project to pixel coordinates, rounded to the nearest whole
  // pixel. latitudes near the poles are clamped, so this is safe
  // to call for any latitude.
  //
  // throws std::out_of_range if zoom >= levels().
  pixel_point to_pixel(const geo_point &ll, unsigned int zoom) const;

  // the inverse of to_pixel, without any rounding. note that
  // to_geo(to_pixel(p)) is only within a pixel of p.
  //
  // throws std::out_of_range if zoom >= levels().
  geo_point to_geo(const pixel_point &px, unsigned int zoom) const;

  unsigned int levels() const { return m_levels; }
  unsigned int tile_size() const { return m_tile_size; }

  // size of the whole world, in pixels, at the given zoom.
  double world_size(unsigned int zoom) const;

private:
  struct zoom_constants {
    double pixels_per_degree;
    double pixels_per_radian;
    double centre;
    double world_size;
  };

  const zoom_constants &at(unsigned int zoom) const;

  unsigned int m_levels, m_tile_size;
  std::vector<zoom_constants> m_constants;
};

} // namespace tessera

#endif // TESSERA_PROJECTION_HPP
