#include "common.hpp"
#include <boost/filesystem.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>
#include <cmath>
#include <exception>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <iomanip>
#include <iostream>

using boost::function;
using std::runtime_error;
using std::exception;
using std::cout;
using std::cerr;
using std::endl;
using std::setw;
using std::flush;
using std::string;
namespace fs = boost::filesystem;

#define TEST_NAME_WIDTH (45)

namespace {

void unwind_nested_exception(std::ostream &out, const std::exception &e) {
  out << e.what();
  try {
    std::rethrow_if_nested(e);

  } catch (const std::exception &nested) {
    out << ". Caused by: ";
    unwind_nested_exception(out, nested);

  } catch (...) {
    out << ". Caused by UNKNOWN EXCEPTION";
  }
}

} // anonymous namespace

namespace test {

void assert_near(double actual, double expected, double tolerance, std::string message) {
  if (!(std::abs(actual - expected) <= tolerance)) {
    throw std::runtime_error((boost::format("%1%: expected=%2% +/- %3%, actual=%4%.")
                              % message % expected % tolerance % actual).str());
  }
}

int run(const string &name, function<void ()> test) {
  cout << setw(TEST_NAME_WIDTH) << name << flush;
  try {
    test();
    cout << "  [PASS]" << endl;
    return 0;

  } catch (const exception &ex) {
    cout << "  [FAIL: ";
    unwind_nested_exception(cout, ex);
    cout << "]" << endl;
    return 1;

  } catch (...) {
    cerr << "  [FAIL: Unexpected error]" << endl;
    throw;
  }
}

json::json() : m_type(json::type_NONE) {}
json::json(const json &j) : m_type(j.m_type), m_buf(j.m_buf.str()) {}

std::ostream &operator<<(std::ostream &out, const json &j) {
   if (j.m_type == json::type_NONE) {
      out << "null";

   } else {
      out << j.m_buf.str();
      if (j.m_type == json::type_DICT) {
         out << "}";
      } else {
         out << "]";
      }
   }
   return out;
}

void json::quote(const json &j) { m_buf << j; }
void json::quote(const std::string &s) { m_buf << "\"" << s << "\""; }
void json::quote(const char *s) { quote(std::string(s)); }
void json::quote(int i) { m_buf << i; }
void json::quote(double d) { m_buf << d; }

temp_dir::temp_dir()
   : m_path(fs::temp_directory_path() / fs::unique_path("tessera-test-%%%%-%%%%-%%%%-%%%%")) {
   fs::create_directories(m_path);
}

temp_dir::~temp_dir() {
   boost::system::error_code err;

   // catch all errors - we don't want to throw in the destructor
   try {
      fs::remove_all(m_path, err);

      // for any non-ignorable error, there's not much we can
      // do from the destructor except complain loudly.
      if (err && (err != boost::system::errc::no_such_file_or_directory)) {
         cerr << "Unable to remove temporary directory " << m_path
              << ": " << err.message() << endl;
      }

   } catch (const std::exception &e) {
      cerr << "Exception caught while trying to remove temporary directory "
           << m_path << ": " << e.what() << endl;
   }
}

void write_file(const fs::path &file, const std::string &content) {
   fs::create_directories(file.parent_path());
   std::ofstream out(file.string(), std::ios::out | std::ios::binary);
   out << content;
   if (!out) {
      throw std::runtime_error((boost::format("Unable to write %1%") % file).str());
   }
}

std::string read_file(const fs::path &file) {
   std::ifstream in(file.string(), std::ios::in | std::ios::binary);
   if (!in) {
      throw std::runtime_error((boost::format("Unable to read %1%") % file).str());
   }
   return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

capture_logger::capture_logger(tessera::logging::severity min_severity)
   : m_min_severity(min_severity) {
}

capture_logger::~capture_logger() {
}

bool capture_logger::enabled(tessera::logging::severity s) const {
   return int(s) >= int(m_min_severity);
}

void capture_logger::log(tessera::logging::severity s, const std::string &message) {
   std::unique_lock<std::mutex> lock(m_mutex);
   m_messages.push_back(std::string(tessera::logging::severity_name(s)) + " " + message);
}

std::size_t capture_logger::count(const std::string &text) const {
   std::unique_lock<std::mutex> lock(m_mutex);
   std::size_t n = 0;
   for (auto const &message : m_messages) {
      if (message.find(text) != std::string::npos) {
         ++n;
      }
   }
   return n;
}

} // namespace test
