// Copyright (C) 2018-2023 The Xaya developers
// Copyright (C) 2026 The quizchain developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "sqlitedatabase.hpp"

#include "quizutil/digest.hpp"

#include <gflags/gflags.h>
#include <glog/logging.h>

#include <chrono>
#include <cstdint>
#include <limits>
#include <utility>

/* Steps taking at least that long are logged as warnings with their SQL.  */
DEFINE_int32 (quiz_sqlite_slow_query_ms, 0,
              "if non-zero, warn about queries taking longer than this");

namespace quiz
{

namespace
{

/**
 * Forwards messages from SQLite's error log to glog.
 */
void
LogSQLiteError (void* arg, const int code, const char* msg)
{
  LOG (ERROR) << "SQLite error " << code << ": " << msg;
}

/**
 * Does the process-wide SQLite setup.  Only the first call has an effect.
 */
void
ConfigureSQLite ()
{
  static bool configured = false;
  if (configured)
    return;
  configured = true;

  LOG (INFO)
      << "SQLite headers " << SQLITE_VERSION
      << ", library " << sqlite3_libversion ();
  CHECK_EQ (sqlite3_libversion_number (), SQLITE_VERSION_NUMBER)
      << "SQLite library does not match the headers";

  const int rc = sqlite3_config (SQLITE_CONFIG_LOG, &LogSQLiteError, nullptr);
  LOG_IF (WARNING, rc != SQLITE_OK)
      << "Could not install the SQLite error log: " << rc;
}

/**
 * Row callback for sqlite3_exec in Execute, where no rows are expected.
 */
int
FailOnRow (void* arg, int columns, char** values, char** names)
{
  LOG (FATAL) << "SQL script returned a row";
}

} // anonymous namespace

/* ************************************************************************** */

SQLiteDatabase::SQLiteDatabase (const std::string& file, const int flags)
{
  ConfigureSQLite ();

  if (sqlite3_open_v2 (file.c_str (), &db, flags, nullptr) != SQLITE_OK)
    LOG (FATAL)
        << "Could not open SQLite database " << file << ": "
        << (db == nullptr ? "out of memory" : sqlite3_errmsg (db));

  CHECK (db != nullptr);
  LOG (INFO) << "Opened SQLite database " << file;
}

SQLiteDatabase::~SQLiteDatabase ()
{
  /* The statements have to be finalised before the connection can
     be closed.  */
  cache.clear ();

  if (sqlite3_close (db) != SQLITE_OK)
    LOG (ERROR) << "Closing the SQLite database failed";
}

void
SQLiteDatabase::Execute (const std::string& sql)
{
  char* err = nullptr;
  const int rc = sqlite3_exec (db, sql.c_str (), &FailOnRow, nullptr, &err);
  if (rc == SQLITE_OK)
    return;

  const std::string msg = (err == nullptr ? "unknown error" : err);
  sqlite3_free (err);
  LOG (FATAL) << "Failed to execute SQL (" << msg << "):\n" << sql;
}

SQLiteDatabase::Statement
SQLiteDatabase::Prepare (const std::string& sql)
{
  return GetStatement (sql);
}

SQLiteDatabase::Statement
SQLiteDatabase::PrepareRo (const std::string& sql) const
{
  return GetStatement (sql);
}

SQLiteDatabase::Statement
SQLiteDatabase::GetStatement (const std::string& sql) const
{
  const auto range = cache.equal_range (sql);
  for (auto it = range.first; it != range.second; ++it)
    {
      CachedStatement& cached = *it->second;
      if (cached.inUse)
        continue;

      /* The return value of sqlite3_reset only repeats the error (if any)
         of the previous step.  */
      sqlite3_reset (cached.stmt);
      CHECK_EQ (sqlite3_clear_bindings (cached.stmt), SQLITE_OK);

      return Statement (cached);
    }

  sqlite3_stmt* stmt = nullptr;
  const int rc = sqlite3_prepare_v2 (db, sql.c_str (), sql.size () + 1,
                                     &stmt, nullptr);
  CHECK_EQ (rc, SQLITE_OK)
      << "Invalid SQL (" << sqlite3_errmsg (db) << "):\n" << sql;

  auto it = cache.emplace (sql, std::make_unique<CachedStatement> (stmt));
  VLOG (2) << "Compiled SQL (" << cache.count (sql) << " cached):\n" << sql;

  return Statement (*it->second);
}

SQLiteDatabase::CachedStatement::~CachedStatement ()
{
  CHECK (!inUse) << "Cached statement is still in use";

  /* Like sqlite3_reset, this just returns the error of the last step.  */
  sqlite3_finalize (stmt);
}

/* ************************************************************************** */

SQLiteDatabase::Statement::Statement (CachedStatement& e)
  : entry(&e)
{
  CHECK (!entry->inUse);
  entry->inUse = true;
}

SQLiteDatabase::Statement::Statement (Statement&& o)
  : entry(o.entry), steps(o.steps)
{
  o.entry = nullptr;
  o.steps = 0;
}

SQLiteDatabase::Statement&
SQLiteDatabase::Statement::operator= (Statement&& o)
{
  if (this != &o)
    {
      Release ();
      std::swap (entry, o.entry);
      std::swap (steps, o.steps);
    }

  return *this;
}

SQLiteDatabase::Statement::~Statement ()
{
  Release ();
}

void
SQLiteDatabase::Statement::Release ()
{
  if (entry == nullptr)
    return;

  entry->inUse = false;
  entry = nullptr;
  steps = 0;
}

sqlite3_stmt*
SQLiteDatabase::Statement::Handle () const
{
  CHECK (entry != nullptr) << "Statement is empty";
  return entry->stmt;
}

std::string
SQLiteDatabase::Statement::GetSql () const
{
  return sqlite3_sql (Handle ());
}

void
SQLiteDatabase::Statement::Execute ()
{
  CHECK (!Step ()) << "Statement returned a row:\n" << GetSql ();
}

bool
SQLiteDatabase::Statement::Step ()
{
  using Clock = std::chrono::steady_clock;

  const auto start = Clock::now ();
  const int rc = sqlite3_step (Handle ());
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds> (
      Clock::now () - start).count ();
  ++steps;

  if (FLAGS_quiz_sqlite_slow_query_ms > 0
        && ms >= FLAGS_quiz_sqlite_slow_query_ms)
    LOG (WARNING)
        << "Slow SQLite query (" << ms << " ms at step " << steps << "):\n"
        << GetSql ();
  else if (steps == 1)
    VLOG (1) << "Running SQL:\n" << GetSql ();
  else
    VLOG (2) << "Step " << steps << " of SQL:\n" << GetSql ();

  if (rc == SQLITE_ROW)
    return true;

  CHECK_EQ (rc, SQLITE_DONE)
      << "SQLite step failed (" << sqlite3_errstr (rc) << "):\n" << GetSql ();
  return false;
}

template <>
  void
  SQLiteDatabase::Statement::Bind<int64_t> (const int ind, const int64_t& val)
{
  CHECK_EQ (sqlite3_bind_int64 (Handle (), ind, val), SQLITE_OK);
}

template <>
  void
  SQLiteDatabase::Statement::Bind<uint64_t> (const int ind, const uint64_t& val)
{
  CHECK_LE (val, static_cast<uint64_t> (std::numeric_limits<int64_t>::max ()))
      << "Value too large for SQLite";
  Bind<int64_t> (ind, static_cast<int64_t> (val));
}

template <>
  void
  SQLiteDatabase::Statement::Bind<std::string> (const int ind,
                                                const std::string& val)
{
  CHECK_EQ (sqlite3_bind_text (Handle (), ind, val.data (), val.size (),
                               SQLITE_TRANSIENT),
            SQLITE_OK);
}

template <>
  void
  SQLiteDatabase::Statement::Bind<Digest> (const int ind, const Digest& val)
{
  CHECK_EQ (sqlite3_bind_blob (Handle (), ind, val.GetBlob (),
                               Digest::NUM_BYTES, SQLITE_TRANSIENT),
            SQLITE_OK);
}

template <>
  int64_t
  SQLiteDatabase::Statement::Get<int64_t> (const int ind) const
{
  return sqlite3_column_int64 (Handle (), ind);
}

template <>
  uint64_t
  SQLiteDatabase::Statement::Get<uint64_t> (const int ind) const
{
  const int64_t val = Get<int64_t> (ind);
  CHECK_GE (val, 0) << "Negative value in unsigned column " << ind;
  return static_cast<uint64_t> (val);
}

template <>
  std::string
  SQLiteDatabase::Statement::Get<std::string> (const int ind) const
{
  /* sqlite3_column_bytes has to be called after sqlite3_column_text,
     which may convert the value first.  */
  const auto* text = sqlite3_column_text (Handle (), ind);
  const int len = sqlite3_column_bytes (Handle (), ind);
  if (len == 0)
    return "";

  CHECK (text != nullptr);
  return std::string (reinterpret_cast<const char*> (text), len);
}

template <>
  Digest
  SQLiteDatabase::Statement::Get<Digest> (const int ind) const
{
  const auto* blob = sqlite3_column_blob (Handle (), ind);
  CHECK_EQ (sqlite3_column_bytes (Handle (), ind),
            static_cast<int> (Digest::NUM_BYTES))
      << "Column " << ind << " does not hold a digest";

  Digest res;
  res.FromBlob (static_cast<const unsigned char*> (blob));
  return res;
}

} // namespace quiz
