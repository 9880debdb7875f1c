#ifndef TESSERA_TILE_ENUMERATOR_HPP
#define TESSERA_TILE_ENUMERATOR_HPP

#include "geometry.hpp"
#include "projection.hpp"
#include "render_request.hpp"

#include <string>
#include <boost/filesystem/path.hpp>

namespace tessera {

// path at which the tile is stored under the tile directory.
boost::filesystem::path tile_path(const boost::filesystem::path &tile_dir,
                                  const tile_coord &tile,
                                  const std::string &extension);

/* Walks the tiles covering a bounding box for each zoom level
 * in [min_z, max_z], in ascending zoom order, and then x, then
 * y order.
 *
 * The tiles are taken from the rectangle of tile indices which
 * contains the projected corners of the box, so some tiles
 * may not intersect the box itself. Indices outside [0, 2^z)
 * are silently dropped.
 *
 * As each tile is produced, the {z} and {z}/{x} directories it
 * will be written into are created if they don't exist already.
 *
 * This is a single pass: once `next` has returned false, it will
 * keep returning false.
 */
class tile_enumerator {
public:
  tile_enumerator(const bounding_box &bbox,
                  unsigned int min_z,
                  unsigned int max_z,
                  unsigned int tile_size,
                  const boost::filesystem::path &tile_dir,
                  const std::string &extension,
                  const std::string &name);

  // this is stateful, and copies would duplicate work.
  tile_enumerator(const tile_enumerator &) = delete;

  // if there are tiles remaining, fills `req` with the next one
  // and returns true. otherwise returns false.
  bool next(render_request &req);

private:
  // set up the index ranges for zoom level m_z.
  void start_zoom();

  const bounding_box m_bbox;
  const unsigned int m_max_z;
  const unsigned int m_tile_size;
  const boost::filesystem::path m_tile_dir;
  const std::string m_extension, m_name;
  const google_projection m_projection;

  // current zoom and position within its index ranges.
  unsigned int m_z;
  long m_x, m_y;
  long m_x_min, m_x_max, m_y_min, m_y_max;
  bool m_done;
};

} // namespace tessera

#endif // TESSERA_TILE_ENUMERATOR_HPP
