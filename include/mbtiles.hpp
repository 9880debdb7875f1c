#ifndef TESSERA_MBTILES_HPP
#define TESSERA_MBTILES_HPP

#include "logging/logger.hpp"

#include <stdexcept>
#include <string>

namespace tessera {

struct mbtiles_error : public std::runtime_error {
  explicit mbtiles_error(const std::string &message);
  virtual ~mbtiles_error() noexcept;
};

struct mbtiles_options {
  mbtiles_options();

  // extension of the tile files to import. files with any other
  // extension are ignored.
  std::string format;
  // "tms" if the y coordinates on disk are already TMS rows, or
  // "xyz" if they count from the north and need flipping.
  std::string scheme;
  // store each distinct tile image once, referenced from a map
  // table, with a "tiles" view over the top.
  bool compression;
};

// TMS row of an XYZ tile y coordinate, or vice versa.
unsigned int flip_y(unsigned int z, unsigned int y);

/* Packages a {z}/{x}/{y}.{ext} directory tree, and the
 * metadata.json in its root if there is one, into a new MBTiles
 * file.
 *
 * Throws mbtiles_error if `mbtiles_file` already exists, or
 * sqlite::sqlite_error if there's a problem writing it.
 */
void disk_to_mbtiles(const std::string &tile_dir,
                     const std::string &mbtiles_file,
                     const mbtiles_options &options,
                     logging::logger &log);

} // namespace tessera

#endif // TESSERA_MBTILES_HPP
