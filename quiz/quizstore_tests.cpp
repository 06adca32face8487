// Copyright (C) 2026 The quizchain developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "quizstore.hpp"

#include "accesscontrol.hpp"
#include "hasher.hpp"
#include "storage.hpp"

#include <gtest/gtest.h>

#include <glog/logging.h>

#include <string>
#include <vector>

namespace quiz
{
namespace
{

/**
 * Test fixture with a QuizStore on a memory storage.  "teacher" is an
 * educator and "student" a registered user.
 */
class QuizStoreTests : public testing::Test
{

protected:

  MemoryQuizStorage storage;
  AccessControl access;

  QuizStoreTests ()
    : access(storage)
  {
    storage.BeginTransaction ();
    access.Bootstrap ({"teacher"});
    CHECK_EQ (access.RegisterUser ("student"), Error::OK);
  }

  ~QuizStoreTests ()
  {
    storage.CommitTransaction ();
  }

  /**
   * Adds a question as the educator to the given store.
   */
  static QuestionId
  Add (QuizStore& store, const std::string& text, const std::string& answer)
  {
    QuestionId id;
    CHECK_EQ (store.AddQuestion (text, answer, "teacher", id), Error::OK);
    return id;
  }

};

TEST_F (QuizStoreTests, SequentialIds)
{
  QuizStore store(storage, access, 0);
  EXPECT_EQ (Add (store, "first", "a"), 0);
  EXPECT_EQ (Add (store, "second", "b"), 1);
  EXPECT_EQ (Add (store, "third", "c"), 2);
}

TEST_F (QuizStoreTests, OnlyHashIsStored)
{
  QuizStore store(storage, access, 0);
  const QuestionId id = Add (store, "What is 2 + 2?", "4");

  Question q;
  ASSERT_EQ (store.GetQuestion (id, q), Error::OK);
  EXPECT_EQ (q.GetId (), id);
  EXPECT_EQ (q.GetText (), "What is 2 + 2?");
  EXPECT_EQ (q.GetAnswerHash (), HashAnswer ("4"));
}

TEST_F (QuizStoreTests, CheckAnswer)
{
  QuizStore store(storage, access, 0);
  const QuestionId id = Add (store, "Capital of France?", "Paris");

  bool correct;
  ASSERT_EQ (store.CheckAnswer (id, "Paris", correct), Error::OK);
  EXPECT_TRUE (correct);

  for (const auto* wrong : {"paris", "Paris ", "", "Berlin"})
    {
      ASSERT_EQ (store.CheckAnswer (id, wrong, correct), Error::OK);
      EXPECT_FALSE (correct) << wrong;
    }
}

TEST_F (QuizStoreTests, NotFound)
{
  QuizStore store(storage, access, 0);
  Add (store, "first", "a");

  bool correct;
  EXPECT_EQ (store.CheckAnswer (1, "a", correct), Error::NOT_FOUND);
  EXPECT_EQ (store.CheckAnswer (static_cast<QuestionId> (-1), "a", correct),
             Error::NOT_FOUND);

  Question q;
  EXPECT_EQ (store.GetQuestion (1, q), Error::NOT_FOUND);
}

TEST_F (QuizStoreTests, Unauthorized)
{
  QuizStore store(storage, access, 0);
  Add (store, "first", "a");

  QuestionId id = 42;
  EXPECT_EQ (store.AddQuestion ("text", "answer", "student", id),
             Error::UNAUTHORIZED);
  EXPECT_EQ (store.AddQuestion ("text", "answer", "stranger", id),
             Error::UNAUTHORIZED);
  EXPECT_EQ (id, 42);

  EXPECT_EQ (store.ListQuestions ().size (), 1);
}

TEST_F (QuizStoreTests, MinAnswerLength)
{
  QuizStore store(storage, access, 3);

  QuestionId id;
  EXPECT_EQ (store.AddQuestion ("text", "ab", "teacher", id),
             Error::INVALID_ANSWER);
  EXPECT_EQ (store.AddQuestion ("text", "", "teacher", id),
             Error::INVALID_ANSWER);
  EXPECT_TRUE (store.ListQuestions ().empty ());

  EXPECT_EQ (Add (store, "text", "abc"), 0);
}

TEST_F (QuizStoreTests, UnauthorizedBeforeAnswerPolicy)
{
  QuizStore store(storage, access, 3);

  QuestionId id;
  EXPECT_EQ (store.AddQuestion ("text", "x", "student", id),
             Error::UNAUTHORIZED);
}

TEST_F (QuizStoreTests, ListQuestions)
{
  QuizStore store(storage, access, 0);
  EXPECT_TRUE (store.ListQuestions ().empty ());

  Add (store, "first", "a");
  Add (store, "second", "b");

  const std::vector<Question> expected =
    {
      Question (0, "first", HashAnswer ("a")),
      Question (1, "second", HashAnswer ("b")),
    };
  EXPECT_EQ (store.ListQuestions (), expected);
  EXPECT_EQ (store.ListQuestions (), expected);
}

} // anonymous namespace
} // namespace quiz
