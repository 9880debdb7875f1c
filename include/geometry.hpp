#ifndef TESSERA_GEOMETRY_HPP
#define TESSERA_GEOMETRY_HPP

#include <iosfwd>

namespace tessera {

// latitude beyond which spherical mercator is undefined. the
// world is square in pixel space between these two latitudes.
const double MERC_MAX_LATITUDE = 85.0511287798065923778;

// longitude / latitude in degrees.
struct geo_point {
  geo_point() : lon(0.0), lat(0.0) {}
  geo_point(double lon_, double lat_) : lon(lon_), lat(lat_) {}

  double lon, lat;
};

// pixel coordinates at a particular zoom level. x increases to
// the east, y increases to the south.
struct pixel_point {
  pixel_point() : x(0.0), y(0.0) {}
  pixel_point(double x_, double y_) : x(x_), y(y_) {}

  double x, y;
};

/* An axis-aligned box. When used for the area to render, the
 * units are degrees of longitude and latitude. The renderer also
 * uses it for boxes in the map's own spatial reference system,
 * in which case the units are whatever that system uses.
 */
struct bounding_box {
  bounding_box() : west(0.0), south(0.0), east(0.0), north(0.0) {}
  bounding_box(double west_, double south_, double east_, double north_)
    : west(west_), south(south_), east(east_), north(north_) {}

  // the whole of the world which can be projected.
  static bounding_box world();

  // returns a copy with longitudes clamped to [-180, 180] and
  // latitudes clamped to the mercator limits.
  bounding_box clamped() const;

  double west, south, east, north;
};

bool operator==(const bounding_box &a, const bounding_box &b);
bool operator!=(const bounding_box &a, const bounding_box &b);

std::ostream &operator<<(std::ostream &, const geo_point &);
std::ostream &operator<<(std::ostream &, const pixel_point &);
std::ostream &operator<<(std::ostream &, const bounding_box &);

} // namespace tessera

#endif // TESSERA_GEOMETRY_HPP
