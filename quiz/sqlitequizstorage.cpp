// Copyright (C) 2026 The quizchain developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "sqlitequizstorage.hpp"

#include "schema.hpp"

#include <glog/logging.h>

#include <cstdint>
#include <limits>

namespace quiz
{

namespace
{

/**
 * Extracts a question from the current row of a statement, which must
 * have the columns id, text and answerhash in this order.
 */
Question
QuestionFromColumns (const SQLiteDatabase::Statement& stmt)
{
  return Question (stmt.Get<uint64_t> (0), stmt.Get<std::string> (1),
                   stmt.Get<Digest> (2));
}

/**
 * Parses a power level stored in the database.
 */
PowerLevel
PowerLevelFromColumn (const SQLiteDatabase::Statement& stmt, const int ind)
{
  const auto str = stmt.Get<std::string> (ind);

  PowerLevel res;
  CHECK (PowerLevelFromString (str, res))
      << "Invalid power level in database: " << str;
  CHECK (res != PowerLevel::UNREGISTERED);

  return res;
}

} // anonymous namespace

SQLiteDatabase&
SQLiteQuizStorage::GetDb ()
{
  CHECK (db != nullptr) << "Storage has not been initialised";
  return *db;
}

const SQLiteDatabase&
SQLiteQuizStorage::GetDb () const
{
  CHECK (db != nullptr) << "Storage has not been initialised";
  return *db;
}

void
SQLiteQuizStorage::CheckInTransaction () const
{
  CHECK (startedTransaction) << "No transaction is active";
}

void
SQLiteQuizStorage::Initialise ()
{
  QuizStorage::Initialise ();
  if (db != nullptr)
    return;

  db = std::make_unique<SQLiteDatabase> (filename,
          SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
  SetupDatabaseSchema (*db);
}

bool
SQLiteQuizStorage::IsInitialised () const
{
  auto stmt = GetDb ().PrepareRo (R"(
    SELECT COUNT(*)
      FROM `contract`
      WHERE `key` = 'initialised'
  )");

  CHECK (stmt.Step ());
  const auto count = stmt.Get<int64_t> (0);
  CHECK (!stmt.Step ());

  CHECK_GE (count, 0);
  CHECK_LE (count, 1);

  return count > 0;
}

void
SQLiteQuizStorage::MarkInitialised ()
{
  CheckInTransaction ();
  GetDb ().Prepare (R"(
    INSERT OR REPLACE INTO `contract`
      (`key`, `value`)
      VALUES ('initialised', 'yes')
  )").Execute ();
}

PowerLevel
SQLiteQuizStorage::GetPowerLevel (const std::string& name) const
{
  auto stmt = GetDb ().PrepareRo (R"(
    SELECT `level`
      FROM `roles`
      WHERE `name` = ?1
  )");
  stmt.Bind (1, name);

  if (!stmt.Step ())
    return PowerLevel::UNREGISTERED;

  const PowerLevel res = PowerLevelFromColumn (stmt, 0);
  CHECK (!stmt.Step ());

  return res;
}

void
SQLiteQuizStorage::SetPowerLevel (const std::string& name, const PowerLevel l)
{
  CheckInTransaction ();
  CHECK (l != PowerLevel::UNREGISTERED) << "Roles cannot be removed";

  auto stmt = GetDb ().Prepare (R"(
    INSERT OR REPLACE INTO `roles`
      (`name`, `level`)
      VALUES (?1, ?2)
  )");
  stmt.Bind (1, name);
  stmt.Bind (2, PowerLevelToString (l));
  stmt.Execute ();
}

std::map<std::string, PowerLevel>
SQLiteQuizStorage::GetAllRoles () const
{
  auto stmt = GetDb ().PrepareRo (R"(
    SELECT `name`, `level`
      FROM `roles`
      ORDER BY `name`
  )");

  std::map<std::string, PowerLevel> res;
  while (stmt.Step ())
    {
      const auto name = stmt.Get<std::string> (0);
      const auto ins = res.emplace (name, PowerLevelFromColumn (stmt, 1));
      CHECK (ins.second) << "Duplicate role entry for " << name;
    }

  return res;
}

QuestionId
SQLiteQuizStorage::GetNumQuestions () const
{
  auto stmt = GetDb ().PrepareRo (R"(
    SELECT COUNT(*), MAX(`id`)
      FROM `questions`
  )");

  CHECK (stmt.Step ());
  const auto count = stmt.Get<uint64_t> (0);
  if (count > 0)
    CHECK_EQ (stmt.Get<uint64_t> (1), count - 1)
        << "Question IDs are not sequential";
  CHECK (!stmt.Step ());

  return count;
}

void
SQLiteQuizStorage::AppendQuestion (const Question& q)
{
  CheckInTransaction ();
  CHECK_EQ (q.GetId (), GetNumQuestions ())
      << "Question ID is not the next in sequence";

  auto stmt = GetDb ().Prepare (R"(
    INSERT INTO `questions`
      (`id`, `text`, `answerhash`)
      VALUES (?1, ?2, ?3)
  )");
  stmt.Bind (1, q.GetId ());
  stmt.Bind (2, q.GetText ());
  stmt.Bind (3, q.GetAnswerHash ());
  stmt.Execute ();
}

bool
SQLiteQuizStorage::GetQuestion (const QuestionId id, Question& q) const
{
  /* IDs beyond the range of SQLite's integers cannot exist.  */
  if (id > static_cast<uint64_t> (std::numeric_limits<int64_t>::max ()))
    return false;

  auto stmt = GetDb ().PrepareRo (R"(
    SELECT `id`, `text`, `answerhash`
      FROM `questions`
      WHERE `id` = ?1
  )");
  stmt.Bind (1, id);

  if (!stmt.Step ())
    return false;

  q = QuestionFromColumns (stmt);
  CHECK (!stmt.Step ());

  return true;
}

std::vector<Question>
SQLiteQuizStorage::GetAllQuestions () const
{
  auto stmt = GetDb ().PrepareRo (R"(
    SELECT `id`, `text`, `answerhash`
      FROM `questions`
      ORDER BY `id`
  )");

  std::vector<Question> res;
  while (stmt.Step ())
    res.push_back (QuestionFromColumns (stmt));

  return res;
}

void
SQLiteQuizStorage::BeginTransaction ()
{
  CHECK (!startedTransaction) << "Transaction is already active";
  startedTransaction = true;
  GetDb ().Prepare ("SAVEPOINT `quiz-invocation`").Execute ();
}

void
SQLiteQuizStorage::CommitTransaction ()
{
  CheckInTransaction ();
  GetDb ().Prepare ("RELEASE `quiz-invocation`").Execute ();
  startedTransaction = false;
}

void
SQLiteQuizStorage::RollbackTransaction ()
{
  CheckInTransaction ();

  /* ROLLBACK TO reverts the changes but keeps the savepoint on the stack,
     so that it has to be released afterwards as well.  */
  GetDb ().Prepare ("ROLLBACK TO `quiz-invocation`").Execute ();
  GetDb ().Prepare ("RELEASE `quiz-invocation`").Execute ();
  startedTransaction = false;
}

} // namespace quiz
