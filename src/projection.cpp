#include "projection.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <boost/format.hpp>

namespace tessera {

namespace {

const double PI = 3.14159265358979323846;
const double DEG_TO_RAD = PI / 180.0;
const double RAD_TO_DEG = 180.0 / PI;

// keeps the log() finite at the poles.
const double MAX_SIN_LATITUDE = 0.9999;

} // anonymous namespace

google_projection::google_projection(unsigned int levels, unsigned int tile_size)
  : m_levels(levels), m_tile_size(tile_size) {

  m_constants.reserve(levels);

  double c = tile_size;
  for (unsigned int z = 0; z < levels; ++z) {
    zoom_constants k;
    k.pixels_per_degree = c / 360.0;
    k.pixels_per_radian = c / (2.0 * PI);
    k.centre = c / 2.0;
    k.world_size = c;
    m_constants.push_back(k);
    c *= 2.0;
  }
}

const google_projection::zoom_constants &google_projection::at(unsigned int zoom) const {
  if (zoom >= m_levels) {
    throw std::out_of_range((boost::format("Zoom level %1% is outside the projection's "
                                           "range [0, %2%).") % zoom % m_levels).str());
  }
  return m_constants[zoom];
}

pixel_point google_projection::to_pixel(const geo_point &ll, unsigned int zoom) const {
  const zoom_constants &k = at(zoom);

  const double e = std::nearbyint(k.centre + ll.lon * k.pixels_per_degree);
  const double f = std::min(std::max(std::sin(DEG_TO_RAD * ll.lat), -MAX_SIN_LATITUDE),
                            MAX_SIN_LATITUDE);
  const double g = std::nearbyint(k.centre + 0.5 * std::log((1.0 + f) / (1.0 - f)) * -k.pixels_per_radian);

  return pixel_point(e, g);
}

geo_point google_projection::to_geo(const pixel_point &px, unsigned int zoom) const {
  const zoom_constants &k = at(zoom);

  const double f = (px.x - k.centre) / k.pixels_per_degree;
  const double g = (px.y - k.centre) / -k.pixels_per_radian;
  const double h = RAD_TO_DEG * (2.0 * std::atan(std::exp(g)) - 0.5 * PI);

  return geo_point(f, h);
}

double google_projection::world_size(unsigned int zoom) const {
  return at(zoom).world_size;
}

} // namespace tessera
