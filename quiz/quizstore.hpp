// Copyright (C) 2026 The quizchain developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef QUIZ_QUIZSTORE_HPP
#define QUIZ_QUIZSTORE_HPP

#include "accesscontrol.hpp"
#include "error.hpp"
#include "question.hpp"
#include "storage.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace quiz
{

/**
 * The sequence of questions.  Educators can append new questions, and
 * everyone can check answers against them.
 */
class QuizStore
{

private:

  /** The storage holding the questions.  */
  QuizStorage& storage;

  /** Access control used to check the requester of new questions.  */
  const AccessControl& access;

  /** Minimum length (in bytes) of answers for new questions.  */
  const size_t minAnswerLength;

public:

  explicit QuizStore (QuizStorage& s, const AccessControl& a,
                      const size_t minLen)
    : storage(s), access(a), minAnswerLength(minLen)
  {}

  QuizStore () = delete;
  QuizStore (const QuizStore&) = delete;
  void operator= (const QuizStore&) = delete;

  /**
   * Adds a new question with the given answer, which is only stored as hash.
   * On success, id is set to the ID of the new question.  Must be called
   * while a transaction is active.
   */
  Error AddQuestion (const std::string& text, const std::string& answer,
                     const std::string& requester, QuestionId& id);

  /**
   * Checks whether the candidate answer is the correct one for the given
   * question.  This needs no permissions and does not modify anything.
   */
  Error CheckAnswer (QuestionId id, const std::string& candidate,
                     bool& correct) const;

  /**
   * Retrieves a question by ID.
   */
  Error GetQuestion (QuestionId id, Question& q) const;

  /**
   * Returns all questions in the order they were added.
   */
  std::vector<Question> ListQuestions () const;

};

} // namespace quiz

#endif // QUIZ_QUIZSTORE_HPP
