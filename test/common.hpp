#include <string>
#include <vector>
#include <mutex>
#include <sstream>
#include <boost/function.hpp>
#include <boost/format.hpp>
#include <boost/noncopyable.hpp>
#include <boost/filesystem.hpp>
#include <stdexcept>

#include "logging/logger.hpp"

namespace test{

template <typename T>
void assert_equal(T actual, T expected, std::string message = std::string()) {
   if (actual != expected) {
      throw std::runtime_error((boost::format("%1%: expected=%2%, actual=%3%.")
                                % message % expected % actual).str());
   }
}

template <typename T>
void assert_not_equal(T actual, T expected, std::string message = std::string()) {
   if (actual == expected) {
      throw std::runtime_error((boost::format("%1%: expected=%2%, actual=%3%.")
                                % message % expected % actual).str());
   }
}

template <typename T>
void assert_less_or_equal(T actual, T expected, std::string message = std::string()) {
   if (actual > expected) {
      throw std::runtime_error((boost::format("%1%: expected=%2%, actual=%3%.")
                                % message % expected % actual).str());
   }
}

template <typename T>
void assert_greater_or_equal(T actual, T expected, std::string message = std::string()) {
   if (actual < expected) {
      throw std::runtime_error((boost::format("%1%: expected=%2%, actual=%3%.")
                                % message % expected % actual).str());
   }
}

// fails unless |actual - expected| <= tolerance.
void assert_near(double actual, double expected, double tolerance,
                 std::string message = std::string());

// fails unless calling `f` throws an exception of type E.
template <typename E, typename F>
void assert_throws(F f, std::string message = std::string()) {
   try {
      f();
   } catch (const E &) {
      return;
   }
   throw std::runtime_error((boost::format("%1%: expected an exception to be thrown.")
                             % message).str());
}

/* runs the test function, formats the output nicely and returns 1
 * if the test failed.
 */
int run(const std::string &name, boost::function<void ()> test);

/* a DSL to make JSON format files. this is nicer than simply
 * quoting the JSON file because C++ lacks heredoc support and
 * uses the same quote character as JSON, so the quoted strings
 * end up looking really ugly.
 */
struct json {
   enum type { type_NONE, type_DICT, type_LIST };

   json();
   json(const json &j);

   /* use operator() to add dictionary key-value entries.
    */
   template <typename T>
   json &operator()(const std::string &key, const T &t) {
      bool first = false;
      if (m_type == type_NONE) { first = true; m_type = type_DICT; }
      if (m_type != type_DICT) { throw std::runtime_error("Mixed type in JSON: expecting DICT."); }
      if (first) { m_buf << "{"; } else { m_buf << ","; }
      m_buf << "\"" << key << "\":";
      quote(t);
      return *this;
   }

   /* use operator[] to add list entries.
    */
   template <typename T>
   json &operator[](const T &t) {
      bool first = false;
      if (m_type == type_NONE) { first = true; m_type = type_LIST; }
      if (m_type != type_LIST) { throw std::runtime_error("Mixed type in JSON: expecting LIST."); }
      if (first) { m_buf << "["; } else { m_buf << ","; }
      quote(t);
      return *this;
   }

   friend std::ostream &operator<<(std::ostream &, const json &);

private:

   void quote(const json &);
   void quote(const std::string &);
   void quote(const char *);
   void quote(int);
   void quote(double);

   type m_type;
   std::ostringstream m_buf;
};

std::ostream &operator<<(std::ostream &, const json &);

/* an RAII temporary directory.
 *
 * on construction, creates a temporary directory. the path to it
 * is available via the path() accessor. upon destruction, it will
 * recursively delete the whole temporary directory tree.
 */
struct temp_dir : boost::noncopyable {
   temp_dir();
   ~temp_dir();
   inline boost::filesystem::path path() const { return m_path; }
private:
   boost::filesystem::path m_path;
};

// write `content` to a file, creating parent directories.
void write_file(const boost::filesystem::path &file, const std::string &content);

// read the whole of a file.
std::string read_file(const boost::filesystem::path &file);

/* a logger which keeps every message, so that tests can check
 * what was logged.
 */
struct capture_logger : public tessera::logging::logger {
   explicit capture_logger(tessera::logging::severity min_severity = tessera::logging::severity::debug);
   virtual ~capture_logger();

   using tessera::logging::logger::log;
   virtual bool enabled(tessera::logging::severity s) const;
   virtual void log(tessera::logging::severity s, const std::string &message);

   // number of messages which contain `text`.
   std::size_t count(const std::string &text) const;

private:
   const tessera::logging::severity m_min_severity;
   mutable std::mutex m_mutex;
   std::vector<std::string> m_messages;
};

} // namespace test
