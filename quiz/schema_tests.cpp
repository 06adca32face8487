// Copyright (C) 2026 The quizchain developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "schema.hpp"

#include <gtest/gtest.h>

#include <sqlite3.h>

namespace quiz
{
namespace
{

class SchemaTests : public testing::Test
{

protected:

  SQLiteDatabase db;

  SchemaTests ()
    : db("test",
         SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_MEMORY)
  {
    SetupDatabaseSchema (db);
  }

};

TEST_F (SchemaTests, MultipleTimesIsOk)
{
  SetupDatabaseSchema (db);
  SetupDatabaseSchema (db);
}

TEST_F (SchemaTests, RoleLevelsAreRestricted)
{
  db.Execute ("INSERT INTO `roles` VALUES ('a', 'user')");
  db.Execute ("INSERT INTO `roles` VALUES ('b', 'educator')");

  EXPECT_DEATH (db.Execute ("INSERT INTO `roles`"
                            " VALUES ('c', 'unregistered')"),
                "Failed to execute SQL");
  EXPECT_DEATH (db.Execute ("INSERT INTO `roles` VALUES ('a', 'educator')"),
                "Failed to execute SQL");
}

TEST_F (SchemaTests, QuestionIdsAreUnique)
{
  db.Execute ("INSERT INTO `questions` VALUES (0, 'q', x'00')");
  EXPECT_DEATH (db.Execute ("INSERT INTO `questions`"
                            " VALUES (0, 'other', x'00')"),
                "Failed to execute SQL");
}

} // anonymous namespace
} // namespace quiz
