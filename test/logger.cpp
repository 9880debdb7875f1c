#include "common.hpp"
#include "logging/logger.hpp"

#include <iostream>
#include <sstream>

using tessera::logging::severity;

namespace {

void test_severity_names() {
  test::assert_equal<std::string>(tessera::logging::severity_name(severity::debug), "DEBUG", "debug");
  test::assert_equal<std::string>(tessera::logging::severity_name(severity::error), "ERROR", "error");
}

void test_stream_logger_filters() {
  std::ostringstream out;
  tessera::logging::stream_logger log(out, severity::warning);

  test::assert_equal<bool>(log.enabled(severity::info), false, "info disabled");
  test::assert_equal<bool>(log.enabled(severity::error), true, "error enabled");

  LOG_INFO(log, "not shown");
  LOG_WARNING(log, boost::format("tile %1% looks odd") % 3);
  log.log(severity::debug, "also not shown");

  test::assert_equal<std::string>(out.str(), "[WARNING] tile 3 looks odd\n", "output");
}

void test_null_logger() {
  tessera::logging::null_logger log;
  test::assert_equal<bool>(log.enabled(severity::error), false, "everything disabled");
  LOG_ERROR(log, "dropped");
}

} // anonymous namespace

int main() {
  int tests_failed = 0;

  std::cout << "== Testing logging ==" << std::endl << std::endl;

#define RUN_TEST(x) { tests_failed += test::run(#x, &(x)); }

  RUN_TEST(test_severity_names);
  RUN_TEST(test_stream_logger_filters);
  RUN_TEST(test_null_logger);

  std::cout << " >> Tests failed: " << tests_failed << std::endl << std::endl;

  return (tests_failed > 0) ? 1 : 0;
}
