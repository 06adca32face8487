// Copyright (C) 2018-2023 The Xaya developers
// Copyright (C) 2026 The quizchain developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef QUIZDB_SQLITEDATABASE_HPP
#define QUIZDB_SQLITEDATABASE_HPP

#include <sqlite3.h>

#include <map>
#include <memory>
#include <string>

namespace quiz
{

/**
 * An open SQLite connection holding the quiz state, together with the
 * prepared statements that have been compiled for it so far.
 *
 * The connection is not synchronised and must only be used from
 * one thread.
 */
class SQLiteDatabase
{

public:

  class Statement;

private:

  struct CachedStatement;

  /** The connection handle.  Owned by this instance.  */
  sqlite3* db = nullptr;

  /**
   * Compiled statements keyed by their SQL text.  The same text can have
   * several entries if it is needed more than once at the same time.
   */
  mutable std::multimap<std::string, std::unique_ptr<CachedStatement>> cache;

  /**
   * Hands out a statement for the given SQL from the cache, compiling it
   * first if all cached ones are taken.
   */
  Statement GetStatement (const std::string& sql) const;

public:

  /**
   * Opens the given database file with the sqlite3_open_v2 flags.
   */
  explicit SQLiteDatabase (const std::string& file, int flags);

  ~SQLiteDatabase ();

  SQLiteDatabase () = delete;
  SQLiteDatabase (const SQLiteDatabase&) = delete;
  void operator= (const SQLiteDatabase&) = delete;

  /**
   * Runs a script of SQL statements that return no rows (like the
   * schema definition).  Failures are fatal.
   */
  void Execute (const std::string& sql);

  /**
   * Returns a statement for the given SQL.  It has been reset and has
   * no bound parameters.
   */
  Statement Prepare (const std::string& sql);

  /**
   * Same as Prepare, for SELECT queries on a const database.
   */
  Statement PrepareRo (const std::string& sql) const;

};

/**
 * A compiled statement owned by the cache.
 */
struct SQLiteDatabase::CachedStatement
{

  sqlite3_stmt* const stmt;

  /** Set while some Statement holds this entry.  */
  bool inUse = false;

  explicit CachedStatement (sqlite3_stmt* s)
    : stmt(s)
  {}

  CachedStatement () = delete;
  CachedStatement (const CachedStatement&) = delete;
  void operator= (const CachedStatement&) = delete;

  /**
   * Finalises the statement.  It must not be handed out anymore.
   */
  ~CachedStatement ();

};

/**
 * Handle to a cached statement, which gives it back to the cache when
 * destructed.  Parameters and columns are accessed through the typed
 * Bind and Get methods.
 */
class SQLiteDatabase::Statement
{

private:

  /** The cache entry held, or null.  */
  CachedStatement* entry = nullptr;

  /** Rows stepped through so far.  */
  unsigned steps = 0;

  explicit Statement (CachedStatement& e);

  /**
   * Gives the entry back to the cache (if there is one).
   */
  void Release ();

  sqlite3_stmt* Handle () const;

  friend class SQLiteDatabase;

public:

  Statement () = default;
  Statement (Statement&& o);
  Statement& operator= (Statement&& o);

  ~Statement ();

  Statement (const Statement&) = delete;
  void operator= (const Statement&) = delete;

  /**
   * Runs a statement that must not return any rows.
   */
  void Execute ();

  /**
   * Advances to the next row.  Returns false once all rows have been
   * read.  SQLite errors are fatal.
   */
  bool Step ();

  /**
   * Returns the statement's SQL text, for log messages.
   */
  std::string GetSql () const;

  /**
   * Binds a parameter (numbered from one).  Supported types are int64_t,
   * uint64_t, std::string (as TEXT) and Digest (as BLOB).
   */
  template <typename T>
    void Bind (int ind, const T& val);

  /**
   * Reads a column (numbered from zero) of the current row, for the same
   * types as Bind.
   */
  template <typename T>
    T Get (int ind) const;

};

} // namespace quiz

#endif // QUIZDB_SQLITEDATABASE_HPP
