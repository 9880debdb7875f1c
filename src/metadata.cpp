#include "metadata.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>
#include <boost/format.hpp>
#include <boost/property_tree/json_parser.hpp>

namespace bpt = boost::property_tree;

namespace tessera {

std::map<std::string, std::string> tileset_metadata::fields() const {
  const std::pair<const char *, const std::string *> all[] = {
    {"attribution", &attribution},
    {"bounds", &bounds},
    {"description", &description},
    {"format", &format},
    {"maxzoom", &maxzoom},
    {"minzoom", &minzoom},
    {"name", &name},
    {"type", &type},
    {"version", &version},
  };

  std::map<std::string, std::string> result;
  for (auto const &field : all) {
    if (!field.second->empty()) {
      result.emplace(field.first, *field.second);
    }
  }
  return result;
}

void tileset_metadata::merge_optional(const bpt::ptree &conf) {
  attribution = conf.get<std::string>("attribution", attribution);
  description = conf.get<std::string>("description", description);
  type = conf.get<std::string>("type", type);
  version = conf.get<std::string>("version", version);
}

namespace {

// undo property_tree's escaping of "/" as "\/". other escapes,
// such as "\\", are left as they are.
std::string unescape_solidus(const std::string &json) {
  std::string result;
  result.reserve(json.size());
  for (std::string::size_type i = 0; i < json.size(); ++i) {
    if ((json[i] == '\\') && (i + 1 < json.size())) {
      if (json[i + 1] != '/') {
        result += json[i];
      }
      result += json[i + 1];
      ++i;
    } else {
      result += json[i];
    }
  }
  return result;
}

} // anonymous namespace

std::string format_coordinate(double v) {
  if (!std::isfinite(v)) {
    return (boost::format("%1%") % v).str();
  }

  // fewest significant digits which read back as the same value.
  char buffer[40];
  int digits = 1;
  for (; digits <= 17; ++digits) {
    std::snprintf(buffer, sizeof(buffer), "%.*e", digits - 1, v);
    if (std::strtod(buffer, nullptr) == v) {
      break;
    }
  }
  digits = std::min(digits, 17);

  // exponent form only below 1e-4 or from 1e16 upwards.
  const int exponent = std::atoi(std::strchr(buffer, 'e') + 1);
  if ((exponent < -4) || (exponent >= 16)) {
    return std::string(buffer);
  }

  std::snprintf(buffer, sizeof(buffer), "%.*f", std::max(digits - 1 - exponent, 0), v);
  std::string result(buffer);
  if (result.find('.') == std::string::npos) {
    result += ".0";
  }
  return result;
}

std::string format_bounds(const bounding_box &bbox) {
  return (boost::format("%1%, %2%, %3%, %4%")
          % format_coordinate(bbox.west) % format_coordinate(bbox.south)
          % format_coordinate(bbox.east) % format_coordinate(bbox.north)).str();
}

void write_metadata_json(const tileset_metadata &metadata, const std::string &file) {
  // ptree keeps insertion order, so inserting from the sorted map
  // gives sorted keys in the output.
  bpt::ptree tree;
  for (auto const &field : metadata.fields()) {
    tree.push_back(bpt::ptree::value_type(field.first, bpt::ptree(field.second)));
  }
  std::ostringstream json;
  bpt::write_json(json, tree, true);

  std::ofstream out(file.c_str(), std::ios::out | std::ios::binary);
  if (!out) {
    throw bpt::json_parser_error("cannot open file", file, 0);
  }
  out << unescape_solidus(json.str());
  if (!out) {
    throw bpt::json_parser_error("write error", file, 0);
  }
}

std::map<std::string, std::string> read_metadata_json(const std::string &file) {
  bpt::ptree tree;
  bpt::read_json(file, tree);

  std::map<std::string, std::string> result;
  for (auto const &row : tree) {
    result[row.first] = row.second.data();
  }
  return result;
}

} // namespace tessera
