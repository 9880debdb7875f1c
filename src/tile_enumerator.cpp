#include "tile_enumerator.hpp"

#include <algorithm>
#include <cmath>
#include <boost/filesystem/operations.hpp>
#include <boost/lexical_cast.hpp>

namespace bfs = boost::filesystem;

namespace tessera {

namespace {

// tile index containing the pixel coordinate, truncating
// towards zero.
inline long tile_index(double pixel, unsigned int tile_size) {
  return static_cast<long>(std::trunc(pixel / double(tile_size)));
}

} // anonymous namespace

bfs::path tile_path(const bfs::path &tile_dir, const tile_coord &tile,
                    const std::string &extension) {
  return tile_dir
    / boost::lexical_cast<std::string>(tile.z)
    / boost::lexical_cast<std::string>(tile.x)
    / (boost::lexical_cast<std::string>(tile.y) + "." + extension);
}

tile_enumerator::tile_enumerator(const bounding_box &bbox,
                                 unsigned int min_z,
                                 unsigned int max_z,
                                 unsigned int tile_size,
                                 const bfs::path &tile_dir,
                                 const std::string &extension,
                                 const std::string &name)
  : m_bbox(bbox), m_max_z(max_z), m_tile_size(tile_size),
    m_tile_dir(tile_dir), m_extension(extension), m_name(name),
    m_projection(max_z + 1, tile_size),
    m_z(min_z), m_x(0), m_y(0),
    m_x_min(0), m_x_max(-1), m_y_min(0), m_y_max(-1),
    m_done(min_z > max_z) {

  if (!m_done) {
    start_zoom();
  }
}

void tile_enumerator::start_zoom() {
  // top-left and bottom-right corners of the box.
  const pixel_point px0 = m_projection.to_pixel(geo_point(m_bbox.west, m_bbox.north), m_z);
  const pixel_point px1 = m_projection.to_pixel(geo_point(m_bbox.east, m_bbox.south), m_z);

  // anything outside [0, 2^z) would be dropped anyway, so
  // narrow the ranges rather than test each coordinate.
  const long limit = (1L << m_z) - 1;
  m_x_min = std::max(tile_index(px0.x, m_tile_size), 0L);
  m_x_max = std::min(tile_index(px1.x, m_tile_size), limit);
  m_y_min = std::max(tile_index(px0.y, m_tile_size), 0L);
  m_y_max = std::min(tile_index(px1.y, m_tile_size), limit);

  m_x = m_x_min;
  m_y = m_y_min;

  bfs::create_directories(m_tile_dir / boost::lexical_cast<std::string>(m_z));
}

bool tile_enumerator::next(render_request &req) {
  while (!m_done) {
    if ((m_x > m_x_max) || (m_y_min > m_y_max)) {
      if (m_z >= m_max_z) {
        m_done = true;
      } else {
        ++m_z;
        start_zoom();
      }
      continue;
    }

    if (m_y > m_y_max) {
      ++m_x;
      m_y = m_y_min;
      continue;
    }

    const tile_coord tile(m_z, m_x, m_y);
    const bfs::path path = tile_path(m_tile_dir, tile, m_extension);

    // only need to check the x directory on the first tile of
    // each column.
    if (m_y == m_y_min) {
      bfs::create_directories(path.parent_path());
    }

    req = render_request(m_name, path.string(), tile);
    ++m_y;
    return true;
  }

  return false;
}

} // namespace tessera
