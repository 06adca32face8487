// Copyright (C) 2026 The quizchain developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "schema.hpp"

#include <glog/logging.h>

namespace quiz
{

namespace
{

constexpr const char* SCHEMA_SQL = R"(

-- Contract-level flags, like whether the quiz has been created.
CREATE TABLE IF NOT EXISTS `contract` (
  `key` TEXT PRIMARY KEY,
  `value` TEXT NOT NULL
);

-- Explicit roles.  Every identity has at most one, and identities that
-- are not in here are unregistered.
CREATE TABLE IF NOT EXISTS `roles` (
  `name` TEXT PRIMARY KEY,
  `level` TEXT NOT NULL CHECK (`level` IN ('user', 'educator'))
);

-- The questions with the hashes of their answers.  The answer itself
-- is never stored.
CREATE TABLE IF NOT EXISTS `questions` (
  `id` INTEGER PRIMARY KEY,
  `text` TEXT NOT NULL,
  `answerhash` BLOB NOT NULL
);

)";

} // anonymous namespace

void
SetupDatabaseSchema (SQLiteDatabase& db)
{
  LOG (INFO) << "Setting up the database schema for the quiz...";
  db.Execute (SCHEMA_SQL);
}

} // namespace quiz
