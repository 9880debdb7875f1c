#ifndef TESSERA_RENDER_REQUEST_HPP
#define TESSERA_RENDER_REQUEST_HPP

#include <string>
#include <iosfwd>
#include <boost/variant.hpp>

namespace tessera {

// identity of a tile. for zoom z, both x and y are in [0, 2^z),
// with x=0 at the west and y=0 at the north.
struct tile_coord {
  tile_coord() : z(0), x(0), y(0) {}
  tile_coord(unsigned int z_, unsigned int x_, unsigned int y_) : z(z_), x(x_), y(y_) {}

  unsigned int z, x, y;
};

bool operator==(const tile_coord &a, const tile_coord &b);
bool operator!=(const tile_coord &a, const tile_coord &b);
bool operator<(const tile_coord &a, const tile_coord &b);
std::ostream &operator<<(std::ostream &, const tile_coord &);

// a single tile to be rendered to `path`. the name is only used
// to tag log messages.
struct render_request {
  render_request() {}
  render_request(const std::string &name_, const std::string &path_, const tile_coord &tile_)
    : name(name_), path(path_), tile(tile_) {}

  std::string name;
  std::string path;
  tile_coord tile;
};

// tells the worker which pops it that there is no more work.
struct shutdown_sentinel {};

typedef boost::variant<render_request, shutdown_sentinel> work_item;

} // namespace tessera

#endif // TESSERA_RENDER_REQUEST_HPP
