// Copyright (C) 2026 The quizchain developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef QUIZ_QUESTION_HPP
#define QUIZ_QUESTION_HPP

#include "quizutil/digest.hpp"

#include <json/json.h>

#include <cstdint>
#include <string>

namespace quiz
{

/** Type of the sequential question IDs.  */
using QuestionId = uint64_t;

/**
 * Converts a question ID to JSON.
 */
Json::Value QuestionIdToJson (QuestionId id);

/**
 * Parses a question ID from JSON.  It must be a non-negative integer
 * literal.  Returns true on success.
 */
bool QuestionIdFromJson (const Json::Value& val, QuestionId& id);

/**
 * A question of the quiz.  It holds the prompt text and the digest of the
 * correct answer, but never the answer itself.
 */
class Question
{

private:

  /** The sequential ID assigned when the question was added.  */
  QuestionId id = 0;

  /** The question's text.  */
  std::string text;

  /** The hash of the correct answer.  */
  Digest answerHash;

public:

  Question ()
  {
    answerHash.SetNull ();
  }

  explicit Question (const QuestionId i, const std::string& t,
                     const Digest& h)
    : id(i), text(t), answerHash(h)
  {}

  Question (const Question&) = default;
  Question& operator= (const Question&) = default;

  QuestionId
  GetId () const
  {
    return id;
  }

  const std::string&
  GetText () const
  {
    return text;
  }

  const Digest&
  GetAnswerHash () const
  {
    return answerHash;
  }

  /**
   * Converts the question (including the answer hash as hex) to JSON.
   */
  Json::Value ToJson () const;

  friend bool
  operator== (const Question& a, const Question& b)
  {
    return a.id == b.id && a.text == b.text && a.answerHash == b.answerHash;
  }

  friend bool
  operator!= (const Question& a, const Question& b)
  {
    return !(a == b);
  }

};

} // namespace quiz

#endif // QUIZ_QUESTION_HPP
