#include "logging/logger.hpp"

#include <iostream>

namespace tessera { namespace logging {

const char *severity_name(severity s) {
  switch (s) {
  case severity::debug:   return "DEBUG";
  case severity::info:    return "INFO";
  case severity::warning: return "WARNING";
  case severity::error:   return "ERROR";
  }
  return "UNKNOWN";
}

logger::~logger() {
}

void logger::log(severity s, const boost::format &fmt) {
  log(s, fmt.str());
}

void logger::log(severity s, const char *message) {
  log(s, std::string(message));
}

stream_logger::stream_logger(severity min_severity)
  : m_out(std::clog), m_min_severity(min_severity) {
}

stream_logger::stream_logger(std::ostream &out, severity min_severity)
  : m_out(out), m_min_severity(min_severity) {
}

stream_logger::~stream_logger() {
}

bool stream_logger::enabled(severity s) const {
  return int(s) >= int(m_min_severity);
}

void stream_logger::log(severity s, const std::string &message) {
  if (!enabled(s)) {
    return;
  }
  std::unique_lock<std::mutex> lock(m_mutex);
  m_out << "[" << severity_name(s) << "] " << message << "\n" << std::flush;
}

null_logger::~null_logger() {
}

bool null_logger::enabled(severity) const {
  return false;
}

void null_logger::log(severity, const std::string &) {
}

} } // namespace tessera::logging
