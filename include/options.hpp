#ifndef TESSERA_OPTIONS_HPP
#define TESSERA_OPTIONS_HPP

#include "mbtiles.hpp"
#include "metadata.hpp"
#include "pipeline.hpp"

#include <iosfwd>
#include <stdexcept>
#include <string>

namespace tessera {

// thrown when the command line is invalid. the message is
// suitable for showing to the user.
struct options_error : public std::runtime_error {
  explicit options_error(const std::string &message);
  virtual ~options_error() noexcept;
};

/**
 * Everything given on the command line, already validated and
 * split up into the options for each part of the program.
 */
struct command_line {
  command_line();

  render_options render;
  mbtiles_options mbtiles;

  // the optional fields (attribution, description, type and
  // version) of the tileset metadata.
  tileset_metadata metadata;

  // path of the MBTiles file to create.
  std::string output;

  std::string fonts_dir, input_plugins_dir;

  // log debug messages.
  bool verbose;
  // remove any existing tile directory before rendering.
  bool clean;
};

/**
 * Parse and validate the command line.
 *
 * Out-of-range bounding box values are clamped to the area which
 * can be projected. Anything else which is invalid, including a
 * zoom range outside [1, 17], an unknown format or tile size, or a
 * missing positional argument, causes an options_error.
 *
 * Returns false if help was asked for, after writing it to `help`.
 */
bool parse_command_line(int argc, const char *const argv[],
                        command_line &cmd, std::ostream &help);

// parse "w,s,e,n" or "w s e n". throws options_error.
bounding_box parse_bbox(const std::string &str);

} // namespace tessera

#endif // TESSERA_OPTIONS_HPP
