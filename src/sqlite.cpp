#include "sqlite.hpp"

#include <iostream>
#include <boost/format.hpp>
#include <sqlite3.h>

namespace tessera { namespace sqlite {

sqlite_error::sqlite_error(const std::string &message)
  : std::runtime_error(message) {
}

sqlite_error::~sqlite_error() noexcept {
}

void sqlite_db_deleter::operator()(sqlite3 *ptr) const {
  if (ptr != nullptr) {
    int status = sqlite3_close(ptr);
    if (status != SQLITE_OK) {
      // can't throw from here, as this is called from destructors.
      std::cerr << "Unable to close SQLite3 database\n" << std::flush;
    }
  }
}

void sqlite_statement_finalizer::operator()(sqlite3_stmt *ptr) const {
  // the error, if any, was already reported by the step which
  // caused it.
  if (ptr != nullptr) {
    sqlite3_finalize(ptr);
  }
}

statement::statement(sqlite3 *db, const std::string &sql)
  : ptr(), db_for_errors(db) {
  const char *tail = nullptr;
  sqlite3_stmt *ptr_ = nullptr;
  int status = sqlite3_prepare_v2(db, sql.c_str(), sql.size(), &ptr_, &tail);
  if (status != SQLITE_OK) {
    throw sqlite_error((boost::format("Unable to prepare SQLite3 statement \"%1%\": %2%") % sql % sqlite3_errmsg(db_for_errors)).str());
  }
  ptr.reset(ptr_);
}

bool statement::step() {
  int status = sqlite3_step(ptr.get());
  if (status == SQLITE_DONE) { return false; }
  if (status != SQLITE_ROW) {
    throw sqlite_error((boost::format("Unable to step row in query result: %1%") % sqlite3_errmsg(db_for_errors)).str());
  }
  return true;
}

void statement::reset() {
  sqlite3_reset(ptr.get());
  sqlite3_clear_bindings(ptr.get());
}

void statement::check_bind(int status) {
  if (status != SQLITE_OK) {
    throw sqlite_error((boost::format("Argument bind failed: %1%") % sqlite3_errmsg(db_for_errors)).str());
  }
}

void statement::bind_int(int i, long long v) {
  check_bind(sqlite3_bind_int64(ptr.get(), i, sqlite3_int64(v)));
}

void statement::bind_text(int i, const std::string &str) {
  check_bind(sqlite3_bind_text(ptr.get(), i, str.data(), int(str.size()), SQLITE_TRANSIENT));
}

void statement::bind_blob(int i, const std::string &bytes) {
  check_bind(sqlite3_bind_blob(ptr.get(), i, bytes.data(), int(bytes.size()), SQLITE_TRANSIENT));
}

long long statement::column_int(int i) {
  return sqlite3_column_int64(ptr.get(), i);
}

boost::optional<std::string> statement::column_text(int i) {
  if (sqlite3_column_type(ptr.get(), i) == SQLITE_NULL) {
    return boost::none;
  } else {
    const unsigned char *str = sqlite3_column_text(ptr.get(), i);
    int sz = sqlite3_column_bytes(ptr.get(), i);
    return std::string((const char *)str, sz);
  }
}

std::string statement::column_blob(int i) {
  const char *bytes = static_cast<const char *>(sqlite3_column_blob(ptr.get(), i));
  int sz = sqlite3_column_bytes(ptr.get(), i);
  if (bytes == nullptr) {
    return std::string();
  }
  return std::string(bytes, sz);
}

db::db(const std::string &loc) {
  sqlite3 *ptr_ = nullptr;
  int status = sqlite3_open(loc.c_str(), &ptr_);
  // sqlite hands back a handle even on failure, which still
  // needs closing.
  ptr.reset(ptr_);
  if (status != SQLITE_OK) {
    throw sqlite_error((boost::format("Unable to open SQLite3 database \"%1%\": %2%") % loc % sqlite3_errmsg(ptr_)).str());
  }
}

statement db::prepare(const std::string &sql) {
  return statement(ptr.get(), sql);
}

void db::exec(const std::string &sql) {
  char *message = nullptr;
  int status = sqlite3_exec(ptr.get(), sql.c_str(), nullptr, nullptr, &message);
  if (status != SQLITE_OK) {
    std::string error = (message != nullptr) ? message : sqlite3_errmsg(ptr.get());
    sqlite3_free(message);
    throw sqlite_error((boost::format("Unable to execute \"%1%\": %2%") % sql % error).str());
  }
}

} } // namespace tessera::sqlite
