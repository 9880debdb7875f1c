#include "geometry.hpp"

#include <algorithm>
#include <ostream>

namespace tessera {

namespace {

inline double clamp(double v, double lo, double hi) {
  return std::min(std::max(lo, v), hi);
}

} // anonymous namespace

bounding_box bounding_box::world() {
  return bounding_box(-180.0, -MERC_MAX_LATITUDE, 180.0, MERC_MAX_LATITUDE);
}

bounding_box bounding_box::clamped() const {
  return bounding_box(clamp(west, -180.0, 180.0),
                      clamp(south, -MERC_MAX_LATITUDE, MERC_MAX_LATITUDE),
                      clamp(east, -180.0, 180.0),
                      clamp(north, -MERC_MAX_LATITUDE, MERC_MAX_LATITUDE));
}

bool operator==(const bounding_box &a, const bounding_box &b) {
  return (a.west == b.west) && (a.south == b.south) &&
    (a.east == b.east) && (a.north == b.north);
}

bool operator!=(const bounding_box &a, const bounding_box &b) {
  return !(a == b);
}

std::ostream &operator<<(std::ostream &out, const geo_point &p) {
  return out << "(" << p.lon << ", " << p.lat << ")";
}

std::ostream &operator<<(std::ostream &out, const pixel_point &p) {
  return out << "(" << p.x << ", " << p.y << ")";
}

std::ostream &operator<<(std::ostream &out, const bounding_box &b) {
  return out << "[" << b.west << ", " << b.south << ", "
             << b.east << ", " << b.north << "]";
}

} // namespace tessera
