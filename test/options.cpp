#include "config.h"
#include "common.hpp"
#include "options.hpp"

#include <iostream>
#include <sstream>
#include <vector>

using tessera::command_line;
using tessera::options_error;

namespace {

bool parse(const std::vector<const char *> &args, command_line &cmd) {
  std::vector<const char *> argv;
  argv.push_back("tessera");
  argv.insert(argv.end(), args.begin(), args.end());
  std::ostringstream help;
  return tessera::parse_command_line(int(argv.size()), argv.data(), cmd, help);
}

void assert_rejected(const std::vector<const char *> &args, const std::string &message) {
  command_line cmd;
  test::assert_throws<options_error>([&]() { parse(args, cmd); }, message);
}

void test_defaults() {
  command_line cmd;
  test::assert_equal<bool>(parse({"maps/style.xml", "out.mbtiles", "2", "5"}, cmd), true, "parsed");

  test::assert_equal<std::string>(cmd.render.map_file, "maps/style.xml", "input");
  test::assert_equal<std::string>(cmd.output, "out.mbtiles", "output");
  test::assert_equal<unsigned int>(cmd.render.min_zoom, 2, "min zoom");
  test::assert_equal<unsigned int>(cmd.render.max_zoom, 5, "max zoom");
  test::assert_equal<unsigned int>(cmd.render.threads, 8, "threads");
  test::assert_equal<unsigned int>(cmd.render.tile_size, 512, "tile size");
  test::assert_equal<std::string>(cmd.render.format, "png", "format");
  test::assert_equal<std::string>(cmd.render.extension, "png", "extension");
  test::assert_equal<std::string>(cmd.render.name, "unknown", "name");
  test::assert_equal<std::string>(cmd.render.tile_dir, "maps/tiles", "tile directory");
  test::assert_equal<bool>(cmd.render.bbox == tessera::bounding_box::world(), true, "bbox");
  test::assert_equal<bool>(cmd.render.stop_on_error, false, "stop on error");
  test::assert_equal<std::string>(cmd.mbtiles.scheme, "tms", "scheme");
  test::assert_equal<std::string>(cmd.mbtiles.format, "png", "archive format");
  test::assert_equal<bool>(cmd.mbtiles.compression, true, "compression");
  test::assert_equal<bool>(cmd.verbose, false, "verbose");
  test::assert_equal<bool>(cmd.clean, false, "clean");
}

void test_all_options() {
  command_line cmd;
  parse({"--bbox=-10,-5,10,5", "--threads", "3", "--name", "roads", "--size", "256",
         "--format", "png256", "--scheme", "xyz", "--no-compression", "-v",
         "--tile-dir", "/tmp/somewhere", "--clean", "--stop-on-error",
         "--attribution", "me", "--version-tag", "1.0.0",
         "style.xml", "out.mbtiles", "1", "17"}, cmd);

  test::assert_equal<bool>(cmd.render.bbox == tessera::bounding_box(-10, -5, 10, 5), true, "bbox");
  test::assert_equal<unsigned int>(cmd.render.threads, 3, "threads");
  test::assert_equal<std::string>(cmd.render.name, "roads", "name");
  test::assert_equal<unsigned int>(cmd.render.tile_size, 256, "tile size");
  test::assert_equal<std::string>(cmd.render.format, "png256", "format");
  test::assert_equal<std::string>(cmd.render.extension, "png", "extension");
  test::assert_equal<std::string>(cmd.mbtiles.format, "png", "archive format");
  test::assert_equal<std::string>(cmd.mbtiles.scheme, "xyz", "scheme");
  test::assert_equal<bool>(cmd.mbtiles.compression, false, "compression");
  test::assert_equal<bool>(cmd.verbose, true, "verbose");
  test::assert_equal<std::string>(cmd.render.tile_dir, "/tmp/somewhere", "tile directory");
  test::assert_equal<bool>(cmd.clean, true, "clean");
  test::assert_equal<bool>(cmd.render.stop_on_error, true, "stop on error");
  test::assert_equal<std::string>(cmd.metadata.attribution, "me", "attribution");
  test::assert_equal<std::string>(cmd.metadata.version, "1.0.0", "version");
  test::assert_equal<unsigned int>(cmd.render.max_zoom, 17, "max zoom");
}

void test_help() {
  command_line cmd;
  std::vector<const char *> argv = {"tessera", "--help"};
  std::ostringstream help;
  test::assert_equal<bool>(tessera::parse_command_line(int(argv.size()), argv.data(), cmd, help),
                           false, "help");
  test::assert_not_equal<std::string::size_type>(help.str().find("--bbox"), std::string::npos, "help text");
  test::assert_not_equal<std::string::size_type>(help.str().find("Report bugs to " PACKAGE_BUGREPORT),
                                                 std::string::npos, "bug report address");
}

void test_bbox_is_clamped() {
  command_line cmd;
  parse({"--bbox=-200,-90,200,90", "style.xml", "out.mbtiles", "1", "2"}, cmd);
  test::assert_equal<bool>(cmd.render.bbox == tessera::bounding_box::world(), true, "clamped to the world");
}

void test_parse_bbox() {
  tessera::bounding_box b = tessera::parse_bbox("1.5, -2,3 4");
  test::assert_equal<double>(b.west, 1.5, "west");
  test::assert_equal<double>(b.south, -2.0, "south");
  test::assert_equal<double>(b.east, 3.0, "east");
  test::assert_equal<double>(b.north, 4.0, "north");

  test::assert_throws<options_error>([]() { tessera::parse_bbox("1,2,3"); }, "too few");
  test::assert_throws<options_error>([]() { tessera::parse_bbox("1,2,3,4,5"); }, "too many");
  test::assert_throws<options_error>([]() { tessera::parse_bbox("1,2,three,4"); }, "not a number");
}

void test_invalid() {
  assert_rejected({"style.xml", "out.mbtiles", "0", "5"}, "min zoom too small");
  assert_rejected({"style.xml", "out.mbtiles", "1", "18"}, "max zoom too big");
  assert_rejected({"style.xml", "out.mbtiles", "6", "5"}, "min above max");
  assert_rejected({"style.xml", "out.mbtiles", "5"}, "missing max");
  assert_rejected({"style.xml", "out.mbtiles", "one", "5"}, "zoom not a number");
  assert_rejected({"--size", "300", "style.xml", "out.mbtiles", "1", "5"}, "bad size");
  assert_rejected({"--format", "gif", "style.xml", "out.mbtiles", "1", "5"}, "bad format");
  assert_rejected({"--scheme", "wmts", "style.xml", "out.mbtiles", "1", "5"}, "bad scheme");
  assert_rejected({"--threads", "0", "style.xml", "out.mbtiles", "1", "5"}, "no threads");
  assert_rejected({"--bbox=1,2,3", "style.xml", "out.mbtiles", "1", "5"}, "short bbox");
  assert_rejected({"--frobnicate", "style.xml", "out.mbtiles", "1", "5"}, "unknown option");
}

// values on the command line win over those in the metadata file.
void test_metadata_file() {
  test::temp_dir tmp;
  const std::string file = (tmp.path() / "meta.json").string();
  std::ostringstream content;
  content << test::json()
    ("attribution", "from the file")
    ("description", "Some roads")
    ("type", "overlay");
  test::write_file(file, content.str());

  command_line cmd;
  const std::string arg = "--metadata-file=" + file;
  parse({arg.c_str(), "--attribution", "from the command line",
         "style.xml", "out.mbtiles", "1", "5"}, cmd);

  test::assert_equal<std::string>(cmd.metadata.attribution, "from the command line", "attribution");
  test::assert_equal<std::string>(cmd.metadata.description, "Some roads", "description");
  test::assert_equal<std::string>(cmd.metadata.type, "overlay", "type");
  test::assert_equal<std::string>(cmd.metadata.version, "", "version");
}

void test_bad_metadata_file() {
  test::temp_dir tmp;
  const std::string file = (tmp.path() / "meta.json").string();
  test::write_file(file, "{ not json");
  const std::string arg = "--metadata-file=" + file;
  assert_rejected({arg.c_str(), "style.xml", "out.mbtiles", "1", "5"}, "unparseable metadata");
}

} // anonymous namespace

int main() {
  int tests_failed = 0;

  std::cout << "== Testing command line options ==" << std::endl << std::endl;

#define RUN_TEST(x) { tests_failed += test::run(#x, &(x)); }

  RUN_TEST(test_defaults);
  RUN_TEST(test_all_options);
  RUN_TEST(test_help);
  RUN_TEST(test_bbox_is_clamped);
  RUN_TEST(test_parse_bbox);
  RUN_TEST(test_invalid);
  RUN_TEST(test_metadata_file);
  RUN_TEST(test_bad_metadata_file);

  std::cout << " >> Tests failed: " << tests_failed << std::endl << std::endl;

  return (tests_failed > 0) ? 1 : 0;
}
