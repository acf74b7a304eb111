#pragma once

#include <sqlite3.h>
#include <sqlite_modern_cpp.h>

#include <string>

namespace recall_core {

enum class DbErrorKind {
  BusyOrLocked,
  Constraint,
  Readonly,
  Io,
  CantOpen,
  Full,
  NotADatabase,
  Schema,
  Generic
};

// Accepts primary or extended result codes.
inline DbErrorKind classify_sqlite_code(int code) {
  switch (code & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return DbErrorKind::BusyOrLocked;
    case SQLITE_CONSTRAINT:
      return DbErrorKind::Constraint;
    case SQLITE_READONLY:
      return DbErrorKind::Readonly;
    case SQLITE_IOERR:
      return DbErrorKind::Io;
    case SQLITE_CANTOPEN:
      return DbErrorKind::CantOpen;
    case SQLITE_FULL:
      return DbErrorKind::Full;
    // SQLCipher reports a wrong key as a file that is not a database
    case SQLITE_NOTADB:
      return DbErrorKind::NotADatabase;
    case SQLITE_ERROR:
    case SQLITE_SCHEMA:
      return DbErrorKind::Schema;
    default:
      return DbErrorKind::Generic;
  }
}

inline std::string to_string(DbErrorKind kind) {
  switch (kind) {
    case DbErrorKind::BusyOrLocked:
      return "busy_or_locked";
    case DbErrorKind::Constraint:
      return "constraint";
    case DbErrorKind::Readonly:
      return "readonly";
    case DbErrorKind::Io:
      return "io";
    case DbErrorKind::CantOpen:
      return "cantopen";
    case DbErrorKind::Full:
      return "full";
    case DbErrorKind::NotADatabase:
      return "not_a_database";
    case DbErrorKind::Schema:
      return "schema";
    default:
      return "generic";
  }
}

// Worth retrying the same write: another connection held the lock past busy_timeout.
inline bool is_transient(DbErrorKind kind) {
  return kind == DbErrorKind::BusyOrLocked;
}

// "<operation> failed: (<kind>) <sqlite message> [code=N, xcode=M]"
inline std::string format_db_error(const std::string &operation,
                                   const sqlite::sqlite_exception &e) {
  const int code = e.get_code();
  const DbErrorKind kind = classify_sqlite_code(code);
  std::string msg = operation + " failed: (" + to_string(kind) + ") " + e.what();
  if (kind == DbErrorKind::NotADatabase) {
    msg += " (wrong database key?)";
  }
  msg += " [code=" + std::to_string(code) + ", xcode=" + std::to_string(e.get_extended_code()) +
         "]";
  return msg;
}

}  // namespace recall_core
