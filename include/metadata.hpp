#ifndef TESSERA_METADATA_HPP
#define TESSERA_METADATA_HPP

#include "geometry.hpp"

#include <map>
#include <string>
#include <boost/property_tree/ptree.hpp>

namespace tessera {

/* Description of the tileset which is stored alongside the tiles
 * and copied into the MBTiles metadata table. All the values are
 * strings, and empty strings mean the field is absent.
 */
struct tileset_metadata {
  std::string name, format, bounds, minzoom, maxzoom;
  std::string attribution, description, type, version;

  // the non-empty fields, keyed (and so sorted) by name.
  std::map<std::string, std::string> fields() const;

  // fill in any of the optional fields (attribution, description,
  // type and version) present in the tree.
  void merge_optional(const boost::property_tree::ptree &conf);
};

// shortest decimal representation of the value which reads back
// as the same double, with a trailing ".0" for whole numbers.
// values below 1e-4 or from 1e16 upwards use exponent form, such
// as "1e-05".
std::string format_coordinate(double v);

// "west, south, east, north"
std::string format_bounds(const bounding_box &bbox);

// write the non-empty fields as a JSON object of strings, with
// sorted keys. throws if the file can't be written.
void write_metadata_json(const tileset_metadata &metadata, const std::string &file);

// read back a JSON object of strings, such as the one written by
// write_metadata_json.
std::map<std::string, std::string> read_metadata_json(const std::string &file);

} // namespace tessera

#endif // TESSERA_METADATA_HPP
