#ifndef TESSERA_LOGGING_LOGGER_HPP
#define TESSERA_LOGGING_LOGGER_HPP

#include <boost/format.hpp>
#include <boost/noncopyable.hpp>
#include <iosfwd>
#include <mutex>
#include <string>

namespace tessera { namespace logging {

enum class severity { debug = 0, info = 1, warning = 2, error = 3 };

const char *severity_name(severity s);

/* Interface for log sinks.
 *
 * Loggers are handed to the components which need them rather
 * than being looked up globally, so that tests can capture the
 * output and so that nothing depends on static initialisation
 * order.
 */
struct logger : public boost::noncopyable {
  virtual ~logger();

  // returns true if messages of severity `s` would be written.
  // callers use this to avoid formatting messages which would
  // only be thrown away.
  virtual bool enabled(severity s) const = 0;

  virtual void log(severity s, const std::string &message) = 0;

  void log(severity s, const boost::format &fmt);
  void log(severity s, const char *message);
};

/* Writes "[severity] message" lines to a stream, dropping
 * anything below the minimum severity. Safe to call from
 * multiple threads.
 */
struct stream_logger : public logger {
  explicit stream_logger(severity min_severity);
  stream_logger(std::ostream &out, severity min_severity);
  virtual ~stream_logger();

  using logger::log;
  virtual bool enabled(severity s) const;
  virtual void log(severity s, const std::string &message);

private:
  std::ostream &m_out;
  const severity m_min_severity;
  std::mutex m_mutex;
};

// discards everything.
struct null_logger : public logger {
  virtual ~null_logger();
  using logger::log;
  virtual bool enabled(severity) const;
  virtual void log(severity, const std::string &);
};

} } // namespace tessera::logging

#define TESSERA_LOG(lg, sev, msg) \
  do { \
    if ((lg).enabled(sev)) { (lg).log((sev), (msg)); } \
  } while (false)

#define LOG_DEBUG(lg, msg) TESSERA_LOG(lg, ::tessera::logging::severity::debug, msg)
#define LOG_INFO(lg, msg) TESSERA_LOG(lg, ::tessera::logging::severity::info, msg)
#define LOG_WARNING(lg, msg) TESSERA_LOG(lg, ::tessera::logging::severity::warning, msg)
#define LOG_ERROR(lg, msg) TESSERA_LOG(lg, ::tessera::logging::severity::error, msg)

#endif // TESSERA_LOGGING_LOGGER_HPP
