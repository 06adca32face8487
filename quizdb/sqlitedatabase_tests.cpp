// Copyright (C) 2018-2023 The Xaya developers
// Copyright (C) 2026 The quizchain developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "sqlitedatabase.hpp"

#include "quizutil/digest.hpp"
#include "quizutil/hash.hpp"

#include <gtest/gtest.h>

#include <glog/logging.h>

#include <cstdint>
#include <limits>
#include <memory>
#include <string>
#include <utility>

namespace quiz
{
namespace
{

constexpr int MEMORY_FLAGS
    = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_MEMORY;

class SQLiteStatementTests : public testing::Test
{

protected:

  SQLiteDatabase db;

  SQLiteStatementTests ()
    : db("test", MEMORY_FLAGS)
  {
    db.Execute (R"(
      CREATE TABLE `test` (
        `id` INTEGER PRIMARY KEY,
        `num` INTEGER NULL,
        `text` TEXT NULL,
        `hash` BLOB NULL
      );
    )");
  }

  /**
   * Inserts a row with the given value in the column and returns what
   * is read back from it.
   */
  template <typename T>
    T
    StoreAndLoad (const std::string& column, const T& val)
  {
    auto stmt = db.Prepare ("INSERT INTO `test` (`" + column + "`)"
                            " VALUES (?1)");
    stmt.Bind (1, val);
    stmt.Execute ();

    stmt = db.PrepareRo ("SELECT `" + column + "` FROM `test`"
                         " WHERE `id` = last_insert_rowid ()");
    CHECK (stmt.Step ());
    const T res = stmt.Get<T> (0);
    CHECK (!stmt.Step ());

    return res;
  }

};

TEST_F (SQLiteStatementTests, Integers)
{
  constexpr auto minSigned = std::numeric_limits<int64_t>::min ();
  constexpr auto maxSigned = std::numeric_limits<int64_t>::max ();

  EXPECT_EQ (StoreAndLoad<int64_t> ("num", 0), 0);
  EXPECT_EQ (StoreAndLoad<int64_t> ("num", -42), -42);
  EXPECT_EQ (StoreAndLoad<int64_t> ("num", minSigned), minSigned);

  const uint64_t large = 1ull << 40;
  EXPECT_EQ (StoreAndLoad<uint64_t> ("num", 0), 0u);
  EXPECT_EQ (StoreAndLoad<uint64_t> ("num", large), large);
  EXPECT_EQ (StoreAndLoad<uint64_t> ("num", maxSigned),
             static_cast<uint64_t> (maxSigned));
}

TEST_F (SQLiteStatementTests, UnsignedOutOfRange)
{
  auto stmt = db.Prepare ("INSERT INTO `test` (`num`) VALUES (?1)");
  const uint64_t tooLarge
      = static_cast<uint64_t> (std::numeric_limits<int64_t>::max ()) + 1;
  EXPECT_DEATH (stmt.Bind<uint64_t> (1, tooLarge), "too large");
}

TEST_F (SQLiteStatementTests, NegativeAsUnsigned)
{
  db.Execute ("INSERT INTO `test` (`num`) VALUES (-1)");

  auto stmt = db.PrepareRo ("SELECT `num` FROM `test`");
  ASSERT_TRUE (stmt.Step ());
  EXPECT_EQ (stmt.Get<int64_t> (0), -1);
  EXPECT_DEATH (stmt.Get<uint64_t> (0), "Negative value");
}

TEST_F (SQLiteStatementTests, Strings)
{
  EXPECT_EQ (StoreAndLoad<std::string> ("text", ""), "");
  EXPECT_EQ (StoreAndLoad<std::string> ("text", "What is 2+2?"),
             "What is 2+2?");
  EXPECT_EQ (StoreAndLoad<std::string> ("text", u8"Wie heißt 'Käse'?"),
             u8"Wie heißt 'Käse'?");

  const std::string withNul("abc\0def", 7);
  EXPECT_EQ (StoreAndLoad<std::string> ("text", withNul), withNul);
}

TEST_F (SQLiteStatementTests, Digests)
{
  Digest zero;
  zero.SetNull ();
  EXPECT_EQ (StoreAndLoad<Digest> ("hash", zero), zero);

  const Digest hash = SHA256::Hash ("Paris");
  EXPECT_EQ (StoreAndLoad<Digest> ("hash", hash), hash);
}

TEST_F (SQLiteStatementTests, DigestWithWrongSize)
{
  db.Execute ("INSERT INTO `test` (`hash`) VALUES (x'0102')");

  auto stmt = db.PrepareRo ("SELECT `hash` FROM `test`");
  ASSERT_TRUE (stmt.Step ());
  EXPECT_DEATH (stmt.Get<Digest> (0), "does not hold a digest");
}

TEST_F (SQLiteStatementTests, CachedStatementIsReset)
{
  db.Execute (R"(
    INSERT INTO `test` (`num`, `text`)
      VALUES (1, 'foo'), (1, 'bar'), (2, 'baz')
  )");

  const std::string sql = R"(
    SELECT `text`
      FROM `test`
      WHERE `num` = ?1
      ORDER BY `text`
  )";

  {
    auto stmt = db.PrepareRo (sql);
    stmt.Bind<int64_t> (1, 1);
    ASSERT_TRUE (stmt.Step ());
    EXPECT_EQ (stmt.Get<std::string> (0), "bar");
  }

  /* The statement is taken from the cache again, and must start
     from the beginning with cleared bindings.  */
  auto stmt = db.PrepareRo (sql);
  stmt.Bind<int64_t> (1, 2);
  ASSERT_TRUE (stmt.Step ());
  EXPECT_EQ (stmt.Get<std::string> (0), "baz");
  ASSERT_FALSE (stmt.Step ());
}

TEST_F (SQLiteStatementTests, ConcurrentUseOfSameSql)
{
  db.Execute ("INSERT INTO `test` (`num`) VALUES (1), (2)");

  const std::string sql = "SELECT `num` FROM `test` ORDER BY `num`";

  auto first = db.PrepareRo (sql);
  ASSERT_TRUE (first.Step ());
  EXPECT_EQ (first.Get<int64_t> (0), 1);

  auto second = db.PrepareRo (sql);
  ASSERT_TRUE (second.Step ());
  EXPECT_EQ (second.Get<int64_t> (0), 1);

  ASSERT_TRUE (first.Step ());
  EXPECT_EQ (first.Get<int64_t> (0), 2);
  ASSERT_FALSE (first.Step ());
}

TEST_F (SQLiteStatementTests, MovedStatement)
{
  db.Execute ("INSERT INTO `test` (`num`) VALUES (5)");

  SQLiteDatabase::Statement stmt;
  stmt = db.PrepareRo ("SELECT `num` FROM `test`");

  SQLiteDatabase::Statement other(std::move (stmt));
  ASSERT_TRUE (other.Step ());
  EXPECT_EQ (other.Get<int64_t> (0), 5);

  EXPECT_DEATH (stmt.Step (), "Statement is empty");
}

TEST_F (SQLiteStatementTests, ExecuteReturningRow)
{
  auto stmt = db.PrepareRo ("SELECT 1");
  EXPECT_DEATH (stmt.Execute (), "returned a row");
}

TEST_F (SQLiteStatementTests, InvalidSql)
{
  EXPECT_DEATH (db.PrepareRo ("SELECT FROM WHERE"), "Invalid SQL");
  EXPECT_DEATH (db.Execute ("CREATE TABLE `test` (`x` INTEGER)"),
                "Failed to execute SQL");
}

TEST (SQLiteDatabaseTests, StatementsMustAllBeDestructed)
{
  auto db = std::make_unique<SQLiteDatabase> ("test", MEMORY_FLAGS);
  auto stmt = db->PrepareRo ("SELECT 1");

  /* At the end of the test scope, the statement will be destructed before
     the database, which is fine.  */
  EXPECT_DEATH (db.reset (), "statement is still in use");
}

} // anonymous namespace
} // namespace quiz
