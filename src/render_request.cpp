#include "render_request.hpp"

#include <ostream>

namespace tessera {

bool operator==(const tile_coord &a, const tile_coord &b) {
  return (a.z == b.z) && (a.x == b.x) && (a.y == b.y);
}

bool operator!=(const tile_coord &a, const tile_coord &b) {
  return !(a == b);
}

bool operator<(const tile_coord &a, const tile_coord &b) {
  if (a.z != b.z) { return a.z < b.z; }
  if (a.x != b.x) { return a.x < b.x; }
  return a.y < b.y;
}

std::ostream &operator<<(std::ostream &out, const tile_coord &t) {
  return out << t.z << "/" << t.x << "/" << t.y;
}

} // namespace tessera
