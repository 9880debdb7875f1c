#include "mbtiles.hpp"
#include "metadata.hpp"
#include "sqlite.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <sstream>
#include <unordered_set>
#include <utility>
#include <vector>
#include <boost/filesystem/operations.hpp>
#include <boost/format.hpp>
#include <boost/optional.hpp>
#include <boost/uuid/name_generator.hpp>
#include <boost/uuid/nil_generator.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace bfs = boost::filesystem;

namespace tessera {

namespace {

// parse a directory or file name as a tile coordinate. names
// which aren't plain non-negative integers are ignored.
boost::optional<unsigned int> parse_index(const std::string &s) {
  if (s.empty() || (s.size() > 9)) {
    return boost::none;
  }
  unsigned int v = 0;
  for (char c : s) {
    if ((c < '0') || (c > '9')) {
      return boost::none;
    }
    v = v * 10 + (c - '0');
  }
  return v;
}

// sub-directories of `dir` whose names are tile indices, in
// ascending order.
std::vector<std::pair<unsigned int, bfs::path> > index_dirs(const bfs::path &dir) {
  std::vector<std::pair<unsigned int, bfs::path> > result;
  for (bfs::directory_iterator itr(dir), end; itr != end; ++itr) {
    if (!bfs::is_directory(itr->status())) {
      continue;
    }
    boost::optional<unsigned int> idx = parse_index(itr->path().filename().string());
    if (idx) {
      result.emplace_back(*idx, itr->path());
    }
  }
  std::sort(result.begin(), result.end());
  return result;
}

std::string read_file(const bfs::path &file) {
  std::ifstream in(file.string(), std::ios::in | std::ios::binary);
  if (!in) {
    throw mbtiles_error((boost::format("Unable to open tile file %1%") % file).str());
  }
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

void optimize_connection(sqlite::db &db) {
  db.exec("PRAGMA synchronous=0");
  db.exec("PRAGMA locking_mode=EXCLUSIVE");
  db.exec("PRAGMA journal_mode=DELETE");
}

void mbtiles_setup(sqlite::db &db) {
  db.exec("CREATE TABLE tiles (zoom_level INTEGER, tile_column INTEGER, "
          "tile_row INTEGER, tile_data BLOB)");
  db.exec("CREATE TABLE metadata (name TEXT, value TEXT)");
  db.exec("CREATE UNIQUE INDEX name ON metadata (name)");
  db.exec("CREATE UNIQUE INDEX tile_index ON tiles (zoom_level, tile_column, tile_row)");
}

void import_metadata(sqlite::db &db, const bfs::path &tile_dir, logging::logger &log) {
  const bfs::path file = tile_dir / "metadata.json";
  if (!bfs::exists(file)) {
    LOG_WARNING(log, boost::format("No metadata found in %1%, MBTiles will have no metadata.")
                % tile_dir);
    return;
  }

  sqlite::statement insert(db.prepare("INSERT INTO metadata (name, value) VALUES (?, ?)"));
  for (auto const &row : read_metadata_json(file.string())) {
    insert.bind_text(1, row.first);
    insert.bind_text(2, row.second);
    insert.step();
    insert.reset();
  }
}

std::size_t import_tiles(sqlite::db &db, const bfs::path &tile_dir,
                         const mbtiles_options &options) {
  const bool flip = (options.scheme == "xyz");
  std::size_t count = 0;

  sqlite::statement insert(db.prepare("INSERT INTO tiles (zoom_level, tile_column, "
                                      "tile_row, tile_data) VALUES (?, ?, ?, ?)"));

  for (auto const &zoom_dir : index_dirs(tile_dir)) {
    const unsigned int z = zoom_dir.first;

    for (auto const &column_dir : index_dirs(zoom_dir.second)) {
      const unsigned int x = column_dir.first;

      for (bfs::directory_iterator itr(column_dir.second), end; itr != end; ++itr) {
        if (!bfs::is_regular_file(itr->status())) {
          continue;
        }

        // split at the first dot, so that "0.png.part" has the
        // extension "png.part" and is skipped.
        const std::string file_name = itr->path().filename().string();
        const std::string::size_type dot = file_name.find('.');
        if (dot == std::string::npos) {
          continue;
        }
        if (file_name.substr(dot + 1) != options.format) {
          continue;
        }
        boost::optional<unsigned int> y = parse_index(file_name.substr(0, dot));
        if (!y) {
          continue;
        }

        insert.bind_int(1, z);
        insert.bind_int(2, x);
        insert.bind_int(3, flip ? flip_y(z, *y) : *y);
        insert.bind_blob(4, read_file(itr->path()));
        insert.step();
        insert.reset();
        ++count;
      }
    }
  }

  return count;
}

void compression_prepare(sqlite::db &db) {
  db.exec("CREATE TABLE IF NOT EXISTS images (tile_data BLOB, tile_id TEXT)");
  db.exec("CREATE TABLE IF NOT EXISTS map (zoom_level INTEGER, tile_column INTEGER, "
          "tile_row INTEGER, tile_id TEXT)");
}

// move each distinct tile image into the images table, keyed by
// an id derived from its content, and record where it's used in
// the map table. returns the number of distinct images.
std::size_t compression_do(sqlite::db &db) {
  boost::uuids::name_generator content_id(boost::uuids::nil_uuid());
  std::unordered_set<std::string> seen;

  sqlite::statement select(db.prepare("SELECT zoom_level, tile_column, tile_row, "
                                      "tile_data FROM tiles"));
  sqlite::statement insert_image(db.prepare("INSERT INTO images (tile_id, tile_data) "
                                            "VALUES (?, ?)"));
  sqlite::statement insert_map(db.prepare("INSERT INTO map (zoom_level, tile_column, "
                                          "tile_row, tile_id) VALUES (?, ?, ?, ?)"));

  while (select.step()) {
    const std::string data = select.column_blob(3);
    const std::string id = boost::uuids::to_string(content_id(data.data(), data.size()));

    if (seen.insert(id).second) {
      insert_image.bind_text(1, id);
      insert_image.bind_blob(2, data);
      insert_image.step();
      insert_image.reset();
    }

    insert_map.bind_int(1, select.column_int(0));
    insert_map.bind_int(2, select.column_int(1));
    insert_map.bind_int(3, select.column_int(2));
    insert_map.bind_text(4, id);
    insert_map.step();
    insert_map.reset();
  }

  return seen.size();
}

void compression_finalize(sqlite::db &db) {
  db.exec("DROP TABLE tiles");
  db.exec("CREATE VIEW tiles AS SELECT map.zoom_level AS zoom_level, "
          "map.tile_column AS tile_column, map.tile_row AS tile_row, "
          "images.tile_data AS tile_data FROM map "
          "JOIN images ON images.tile_id = map.tile_id");
  db.exec("CREATE UNIQUE INDEX map_index ON map (zoom_level, tile_column, tile_row)");
  db.exec("CREATE UNIQUE INDEX images_id ON images (tile_id)");
}

} // anonymous namespace

mbtiles_error::mbtiles_error(const std::string &message)
  : std::runtime_error(message) {
}

mbtiles_error::~mbtiles_error() noexcept {
}

mbtiles_options::mbtiles_options()
  : format("png"), scheme("tms"), compression(true) {
}

unsigned int flip_y(unsigned int z, unsigned int y) {
  return (1u << z) - 1 - y;
}

void disk_to_mbtiles(const std::string &tile_dir,
                     const std::string &mbtiles_file,
                     const mbtiles_options &options,
                     logging::logger &log) {
  if (bfs::exists(mbtiles_file)) {
    throw mbtiles_error((boost::format("Importing tiles into already-existing MBTiles "
                                       "\"%1%\" is not supported.") % mbtiles_file).str());
  }
  if (!bfs::is_directory(tile_dir)) {
    throw mbtiles_error((boost::format("Tile directory \"%1%\" does not exist.")
                         % tile_dir).str());
  }
  if ((options.scheme != "xyz") && (options.scheme != "tms")) {
    throw mbtiles_error((boost::format("Unknown tiling scheme \"%1%\".") % options.scheme).str());
  }

  LOG_INFO(log, boost::format("Importing disk to MBTiles: %1% --> %2%") % tile_dir % mbtiles_file);

  sqlite::db db(mbtiles_file);
  optimize_connection(db);
  mbtiles_setup(db);

  db.exec("BEGIN");
  import_metadata(db, tile_dir, log);
  const std::size_t count = import_tiles(db, tile_dir, options);
  LOG_DEBUG(log, boost::format("%1% tiles inserted.") % count);

  if (options.compression) {
    compression_prepare(db);
    const std::size_t distinct = compression_do(db);
    compression_finalize(db);
    LOG_DEBUG(log, boost::format("%1% tiles stored as %2% distinct images.") % count % distinct);
  }
  db.exec("COMMIT");

  db.exec("ANALYZE");
  db.exec("VACUUM");
}

} // namespace tessera
