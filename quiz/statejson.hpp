// Copyright (C) 2026 The quizchain developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef QUIZ_STATEJSON_HPP
#define QUIZ_STATEJSON_HPP

#include "contract.hpp"
#include "question.hpp"

#include "quizutil/digest.hpp"

#include <json/json.h>

#include <string>

namespace quiz
{

/**
 * Wrapper around a (read-only) contract, which is able to extract bits
 * of the state as JSON.  These are the free queries the host serves,
 * in an easily-testable form.
 */
class StateJsonExtractor
{

private:

  /** The underlying contract.  */
  const QuizContract& contract;

public:

  explicit StateJsonExtractor (const QuizContract& c)
    : contract(c)
  {}

  StateJsonExtractor () = delete;
  StateJsonExtractor (const StateJsonExtractor&) = delete;
  void operator= (const StateJsonExtractor&) = delete;

  /**
   * Returns the IDs and texts of all questions in order.
   */
  Json::Value ListQuestions () const;

  /**
   * Returns the full data of one question (including the answer hash),
   * or null if it does not exist.
   */
  Json::Value GetQuestion (QuestionId id) const;

  /**
   * Checks an answer.  The result is an object with either a boolean
   * "correct" field, or an "error" field.
   */
  Json::Value CheckAnswer (QuestionId id, const std::string& answer) const;

  /**
   * Returns the power level of the given identity as string.
   */
  Json::Value GetPowerLevel (const std::string& name) const;

  /**
   * Returns the entire state as JSON.
   */
  Json::Value FullState () const;

  /**
   * Computes a hash of the full state, which is the same for two quizzes
   * exactly if their questions and roles agree.
   */
  Digest HashState () const;

};

} // namespace quiz

#endif // QUIZ_STATEJSON_HPP
