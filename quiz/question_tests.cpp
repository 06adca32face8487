// Copyright (C) 2026 The quizchain developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "question.hpp"

#include "error.hpp"
#include "hasher.hpp"
#include "powerlevel.hpp"
#include "testutils.hpp"

#include <gtest/gtest.h>

#include <sstream>

namespace quiz
{
namespace
{

TEST (QuestionIdJsonTests, Valid)
{
  QuestionId id;

  ASSERT_TRUE (QuestionIdFromJson (ParseJson ("0"), id));
  EXPECT_EQ (id, 0);

  ASSERT_TRUE (QuestionIdFromJson (ParseJson ("42"), id));
  EXPECT_EQ (id, 42);

  EXPECT_EQ (QuestionIdToJson (42), ParseJson ("42"));
}

TEST (QuestionIdJsonTests, Invalid)
{
  QuestionId id;
  for (const auto* str : {"-1", "1.5", "1e3", "\"5\"", "null", "[]", "{}"})
    EXPECT_FALSE (QuestionIdFromJson (ParseJson (str), id)) << str;
}

TEST (QuestionTests, ToJson)
{
  const Question q(5, "What is 2 + 2?", HashAnswer ("4"));
  EXPECT_EQ (q.ToJson (), ParseJson (R"({
    "id": 5,
    "text": "What is 2 + 2?",
    "answerhash": "4b227777d4dd1fc61c6f884f48641d02b4d121d3fd328cb08b5531fcacdabf8a"
  })"));
}

TEST (QuestionTests, Equality)
{
  const Question q(1, "text", HashAnswer ("answer"));

  EXPECT_EQ (q, Question (1, "text", HashAnswer ("answer")));
  EXPECT_NE (q, Question (2, "text", HashAnswer ("answer")));
  EXPECT_NE (q, Question (1, "other", HashAnswer ("answer")));
  EXPECT_NE (q, Question (1, "text", HashAnswer ("other")));
}

TEST (PowerLevelTests, StringConversion)
{
  for (const auto l : {PowerLevel::UNREGISTERED, PowerLevel::USER,
                       PowerLevel::EDUCATOR})
    {
      PowerLevel parsed;
      ASSERT_TRUE (PowerLevelFromString (PowerLevelToString (l), parsed));
      EXPECT_EQ (parsed, l);
    }

  EXPECT_EQ (PowerLevelToString (PowerLevel::EDUCATOR), "educator");

  PowerLevel parsed;
  EXPECT_FALSE (PowerLevelFromString ("admin", parsed));
  EXPECT_FALSE (PowerLevelFromString ("Educator", parsed));
}

TEST (ErrorTests, Printing)
{
  std::ostringstream out;
  out << Error::OK << " " << Error::UNAUTHORIZED << " " << Error::NOT_FOUND;
  EXPECT_EQ (out.str (), "ok unauthorized not_found");

  EXPECT_EQ (ErrorToString (Error::NO_EDUCATORS), "no_educators");
  EXPECT_EQ (ErrorToString (Error::ALREADY_INITIALISED),
             "already_initialised");
  EXPECT_EQ (ErrorToString (Error::INVALID_ANSWER), "invalid_answer");
}

} // anonymous namespace
} // namespace quiz
