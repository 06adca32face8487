// Copyright (C) 2026 The quizchain developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef QUIZ_SCHEMA_HPP
#define QUIZ_SCHEMA_HPP

#include "quizdb/sqlitedatabase.hpp"

namespace quiz
{

/**
 * Sets up the database schema (if it is not already present) on the given
 * SQLite connection.
 */
void SetupDatabaseSchema (SQLiteDatabase& db);

} // namespace quiz

#endif // QUIZ_SCHEMA_HPP
