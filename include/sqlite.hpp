#ifndef TESSERA_SQLITE_HPP
#define TESSERA_SQLITE_HPP

#include <memory>
#include <stdexcept>
#include <string>
#include <boost/optional.hpp>

struct sqlite3;
struct sqlite3_stmt;

namespace tessera { namespace sqlite {

// thrown for any error reported by SQLite.
struct sqlite_error : public std::runtime_error {
  explicit sqlite_error(const std::string &message);
  virtual ~sqlite_error() noexcept;
};

struct sqlite_db_deleter {
  void operator()(sqlite3 *ptr) const;
};

struct sqlite_statement_finalizer {
  void operator()(sqlite3_stmt *ptr) const;
};

struct db;

/* A prepared statement. Parameters are numbered from 1, as in
 * SQLite, and columns from 0.
 */
struct statement {
  statement(statement &&) = default;

  // returns true if there is a row to read, false if the
  // statement has finished.
  bool step();

  // make the statement ready to be stepped again, with new
  // parameters.
  void reset();

  void bind_int(int i, long long v);
  void bind_text(int i, const std::string &str);
  void bind_blob(int i, const std::string &bytes);

  long long column_int(int i);
  boost::optional<std::string> column_text(int i);
  std::string column_blob(int i);

private:
  friend struct db;
  statement(sqlite3 *db, const std::string &sql);

  void check_bind(int status);

  std::unique_ptr<sqlite3_stmt, sqlite_statement_finalizer> ptr;
  sqlite3 *db_for_errors; // use for ERRORS only.
};

struct db {
  // opens, creating if necessary, the database at `loc`.
  explicit db(const std::string &loc);

  statement prepare(const std::string &sql);

  // run one or more statements which return no rows.
  void exec(const std::string &sql);

private:
  std::unique_ptr<sqlite3, sqlite_db_deleter> ptr;
};

} } // namespace tessera::sqlite

#endif // TESSERA_SQLITE_HPP
