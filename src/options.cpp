#include "options.hpp"
#include "config.h"

#include <algorithm>
#include <ostream>
#include <vector>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/filesystem/path.hpp>
#include <boost/format.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <boost/property_tree/json_parser.hpp>

namespace bpo = boost::program_options;
namespace bpt = boost::property_tree;
namespace bfs = boost::filesystem;

namespace tessera {

namespace {

const unsigned int MIN_ZOOM = 1;
const unsigned int MAX_ZOOM = 17;

const char *const FORMATS[] = {"jpg", "png", "png8", "png24", "png32", "png256", "webp"};
const unsigned int TILE_SIZES[] = {256, 512, 1024};

template <typename T, typename U, std::size_t N>
bool one_of(const T &value, const U (&choices)[N]) {
  return std::find(choices, choices + N, value) != choices + N;
}

void check_zoom(const char *which, int z) {
  if ((z < int(MIN_ZOOM)) || (z > int(MAX_ZOOM))) {
    throw options_error((boost::format("The %1% zoom level %2% is outside the range %3%..%4%.")
                         % which % z % MIN_ZOOM % MAX_ZOOM).str());
  }
}

} // anonymous namespace

options_error::options_error(const std::string &message)
  : std::runtime_error(message) {
}

options_error::~options_error() noexcept {
}

command_line::command_line()
  : fonts_dir(MAPNIK_DEFAULT_FONT_DIR),
    input_plugins_dir(MAPNIK_DEFAULT_INPUT_PLUGIN_DIR),
    verbose(false), clean(false) {
}

bounding_box parse_bbox(const std::string &str) {
  std::vector<std::string> parts;
  boost::algorithm::split(parts, str, boost::algorithm::is_any_of(", "),
                          boost::algorithm::token_compress_on);
  parts.erase(std::remove(parts.begin(), parts.end(), std::string()), parts.end());

  if (parts.size() != 4) {
    throw options_error((boost::format("Expected four numbers for the bounding box, "
                                       "but got \"%1%\".") % str).str());
  }

  double v[4];
  for (int i = 0; i < 4; ++i) {
    try {
      v[i] = boost::lexical_cast<double>(parts[i]);
    } catch (const boost::bad_lexical_cast &) {
      throw options_error((boost::format("\"%1%\" in the bounding box is not a number.")
                           % parts[i]).str());
    }
  }

  return bounding_box(v[0], v[1], v[2], v[3]);
}

bool parse_command_line(int argc, const char *const argv[],
                        command_line &cmd, std::ostream &help) {
  std::string bbox, metadata_file;
  int min_z = 0, max_z = 0, threads = 0;
  bool no_compression = false;

  bpo::options_description options(
    "Tessera " VERSION "\n"
    "\n"
    "  Usage: tessera [options] <input> <output> <min> <max>\n"
    "\n"
    "Renders the tiles covering the bounding box at zoom levels <min> to <max> "
    "from the Mapnik XML style <input>, and packages them into the new MBTiles "
    "file <output>.\n"
    "\n"
    "Report bugs to " PACKAGE_BUGREPORT "\n"
    "\n");

  options.add_options()
    ("help,h", "Print this help message.")
    ("bbox", bpo::value<std::string>(&bbox),
     "Bounding box to render, as \"west,south,east,north\" in degrees. Defaults to "
     "the whole world.")
    ("threads", bpo::value<int>(&threads)->default_value(8),
     "Number of rendering threads to spawn.")
    ("name", bpo::value<std::string>(&cmd.render.name)->default_value("unknown"),
     "Name for each renderer, used in log messages.")
    ("size", bpo::value<unsigned int>(&cmd.render.tile_size)->default_value(512),
     "Resolution of the tile images: 256, 512 or 1024.")
    ("format", bpo::value<std::string>(&cmd.render.format)->default_value("png"),
     "Format of the tile images: jpg, png, png8, png24, png32, png256 or webp.")
    ("scheme", bpo::value<std::string>(&cmd.mbtiles.scheme)->default_value("tms"),
     "Tiling scheme of the tiles: xyz or tms.")
    ("no-compression", bpo::bool_switch(&no_compression),
     "Disable MBTiles compression (de-duplication of identical tiles).")
    ("verbose,v", bpo::bool_switch(&cmd.verbose), "Log debugging output.")
    ("tile-dir", bpo::value<std::string>(&cmd.render.tile_dir),
     "Directory to render tiles into. Defaults to \"tiles\" next to the input file.")
    ("clean", bpo::bool_switch(&cmd.clean),
     "Remove any existing tile directory before rendering, rather than re-using "
     "tiles which already exist.")
    ("stop-on-error", bpo::bool_switch(&cmd.render.stop_on_error),
     "Stop all rendering at the first tile which fails, rather than carrying on "
     "and reporting the number of failures at the end.")
    ("fonts", bpo::value<std::string>(&cmd.fonts_dir)->default_value(MAPNIK_DEFAULT_FONT_DIR),
     "Directory to tell Mapnik to look in for fonts.")
    ("input-plugins", bpo::value<std::string>(&cmd.input_plugins_dir)
     ->default_value(MAPNIK_DEFAULT_INPUT_PLUGIN_DIR),
     "Directory to tell Mapnik to look in for input plugins.")
    ("metadata-file", bpo::value<std::string>(&metadata_file),
     "JSON file with optional tileset metadata: attribution, description, type "
     "and version.")
    ("attribution", bpo::value<std::string>(&cmd.metadata.attribution),
     "Attribution to store in the tileset metadata.")
    ("description", bpo::value<std::string>(&cmd.metadata.description),
     "Description to store in the tileset metadata.")
    ("type", bpo::value<std::string>(&cmd.metadata.type),
     "Layer type to store in the tileset metadata: overlay or baselayer.")
    ("version-tag", bpo::value<std::string>(&cmd.metadata.version),
     "Version to store in the tileset metadata.")
    // positional arguments
    ("input", bpo::value<std::string>(&cmd.render.map_file), "Mapnik XML input file.")
    ("output", bpo::value<std::string>(&cmd.output), "MBTiles file to create.")
    ("min", bpo::value<int>(&min_z), "Minimum zoom level to render.")
    ("max", bpo::value<int>(&max_z), "Maximum zoom level to render.")
    ;

  bpo::positional_options_description pos_options;
  pos_options
    .add("input", 1)
    .add("output", 1)
    .add("min", 1)
    .add("max", 1)
    ;

  bpo::variables_map vm;

  try {
    bpo::store(bpo::command_line_parser(argc, argv)
               .options(options)
               .positional(pos_options)
               .run(),
               vm);
    bpo::notify(vm);

  } catch (const bpo::error &e) {
    throw options_error((boost::format("Unable to parse command line options because: %1%")
                         % e.what()).str());
  }

  if (vm.count("help")) {
    help << options << "\n";
    return false;
  }

  // argument checking and verification
  for (auto arg : {"input", "output", "min", "max"}) {
    if (vm.count(arg) == 0) {
      throw options_error((boost::format("The <%1%> argument was not provided, but is "
                                         "mandatory.") % arg).str());
    }
  }

  check_zoom("minimum", min_z);
  check_zoom("maximum", max_z);
  if (min_z > max_z) {
    throw options_error((boost::format("The minimum zoom level %1% is greater than the "
                                       "maximum zoom level %2%.") % min_z % max_z).str());
  }
  cmd.render.min_zoom = min_z;
  cmd.render.max_zoom = max_z;

  if (threads < 1) {
    throw options_error("Number of rendering threads must be at least one.");
  }
  cmd.render.threads = threads;

  if (!one_of(cmd.render.tile_size, TILE_SIZES)) {
    throw options_error((boost::format("Tile size %1% is not one of 256, 512 or 1024.")
                         % cmd.render.tile_size).str());
  }

  if (!one_of(cmd.render.format, FORMATS)) {
    throw options_error((boost::format("Unknown tile format \"%1%\".") % cmd.render.format).str());
  }

  if ((cmd.mbtiles.scheme != "xyz") && (cmd.mbtiles.scheme != "tms")) {
    throw options_error((boost::format("Unknown tiling scheme \"%1%\".") % cmd.mbtiles.scheme).str());
  }

  cmd.render.bbox = bbox.empty() ? bounding_box::world() : parse_bbox(bbox).clamped();
  cmd.render.extension = extension_for_format(cmd.render.format);

  if (cmd.render.tile_dir.empty()) {
    cmd.render.tile_dir = (bfs::path(cmd.render.map_file).parent_path() / "tiles").string();
  }

  cmd.mbtiles.format = cmd.render.extension;
  cmd.mbtiles.compression = !no_compression;

  if (!metadata_file.empty()) {
    try {
      bpt::ptree conf;
      bpt::read_json(metadata_file, conf);

      // values given directly on the command line win over the
      // ones in the file.
      tileset_metadata from_file;
      from_file.merge_optional(conf);
      for (auto field : {std::make_pair(&cmd.metadata.attribution, &from_file.attribution),
                         std::make_pair(&cmd.metadata.description, &from_file.description),
                         std::make_pair(&cmd.metadata.type, &from_file.type),
                         std::make_pair(&cmd.metadata.version, &from_file.version)}) {
        if (field.first->empty()) {
          *field.first = *field.second;
        }
      }

    } catch (const bpt::ptree_error &e) {
      throw options_error((boost::format("Error while parsing metadata file %1%: %2%")
                           % metadata_file % e.what()).str());
    }
  }

  return true;
}

} // namespace tessera
