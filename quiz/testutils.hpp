// Copyright (C) 2026 The quizchain developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef QUIZ_TESTUTILS_HPP
#define QUIZ_TESTUTILS_HPP

#include "contract.hpp"
#include "question.hpp"
#include "sqlitequizstorage.hpp"

#include <gtest/gtest.h>

#include <json/json.h>

#include <string>

namespace quiz
{

/**
 * Parses JSON from a string.
 */
Json::Value ParseJson (const std::string& val);

/**
 * Test fixture with a quiz on a temporary, in-memory SQLite database.
 * The quiz is already created with "teacher" as the only educator.
 */
class QuizTest : public testing::Test
{

protected:

  /** The educator the quiz is created with.  */
  static constexpr const char* EDUCATOR = "teacher";

  SQLiteQuizStorage storage;
  QuizContract contract;

  QuizTest ();

  /**
   * Adds a question as the educator and returns its ID.
   */
  QuestionId AddQuestion (const std::string& text, const std::string& answer);

};

} // namespace quiz

#endif // QUIZ_TESTUTILS_HPP
