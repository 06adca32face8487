// Copyright (C) 2026 The quizchain developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef QUIZ_SQLITEQUIZSTORAGE_HPP
#define QUIZ_SQLITEQUIZSTORAGE_HPP

#include "storage.hpp"

#include "quizdb/sqlitedatabase.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace quiz
{

/**
 * Implementation of QuizStorage that keeps the state in an SQLite
 * database file.  Each transaction is an SQLite savepoint.
 */
class SQLiteQuizStorage : public QuizStorage
{

private:

  /** The filename of the database.  */
  const std::string filename;

  /** The database connection, once opened.  */
  std::unique_ptr<SQLiteDatabase> db;

  /** Set to true while a transaction is active.  */
  bool startedTransaction = false;

  /**
   * Returns the database instance and checks that it is opened.
   */
  SQLiteDatabase& GetDb ();
  const SQLiteDatabase& GetDb () const;

  /**
   * Checks that a transaction is active, which is required for
   * all modifications.
   */
  void CheckInTransaction () const;

public:

  explicit SQLiteQuizStorage (const std::string& f)
    : filename(f)
  {}

  SQLiteQuizStorage () = delete;
  SQLiteQuizStorage (const SQLiteQuizStorage&) = delete;
  void operator= (const SQLiteQuizStorage&) = delete;

  /**
   * Opens the database file (creating it if it does not exist)
   * and sets up the schema.
   */
  void Initialise () override;

  bool IsInitialised () const override;
  void MarkInitialised () override;

  PowerLevel GetPowerLevel (const std::string& name) const override;
  void SetPowerLevel (const std::string& name, PowerLevel l) override;
  std::map<std::string, PowerLevel> GetAllRoles () const override;

  QuestionId GetNumQuestions () const override;
  void AppendQuestion (const Question& q) override;
  bool GetQuestion (QuestionId id, Question& q) const override;
  std::vector<Question> GetAllQuestions () const override;

  void BeginTransaction () override;
  void CommitTransaction () override;
  void RollbackTransaction () override;

};

} // namespace quiz

#endif // QUIZ_SQLITEQUIZSTORAGE_HPP
