// Copyright (C) 2026 The quizchain developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef QUIZ_CONTRACT_HPP
#define QUIZ_CONTRACT_HPP

#include "accesscontrol.hpp"
#include "error.hpp"
#include "powerlevel.hpp"
#include "question.hpp"
#include "quizstore.hpp"
#include "storage.hpp"

#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace quiz
{

/**
 * Settings for the quiz contract, set up by the host.
 */
struct ContractConfig
{

  /**
   * Answers of new questions must be at least this many bytes long.
   * Zero disables the check.
   */
  size_t MinAnswerLength = 0;

};

/**
 * The entry points of the quiz, as invoked by the host.  The caller
 * identity is passed in for each call as resolved by the host.
 *
 * Each mutating call is run in its own transaction on the storage, which
 * is only committed if the call succeeds.  Thus a failed call never
 * changes the state.  Calls must not be made concurrently.
 */
class QuizContract
{

private:

  /** The underlying storage.  */
  QuizStorage& storage;

  AccessControl access;
  QuizStore store;

  /**
   * Checks that the quiz has been initialised, which is required
   * for all mutating calls.
   */
  void CheckInitialised () const;

public:

  explicit QuizContract (QuizStorage& s,
                         const ContractConfig& config = ContractConfig ());

  QuizContract () = delete;
  QuizContract (const QuizContract&) = delete;
  void operator= (const QuizContract&) = delete;

  /**
   * Creates the quiz with the given initial educators.  Fails if the set
   * is empty, or if the storage already holds an initialised quiz.
   */
  Error Initialise (const std::set<std::string>& educators);

  /**
   * Returns true if the quiz has been created already (in this process
   * or in an earlier one with the same persistent storage).
   */
  bool IsInitialised () const;

  Error AddQuestion (const std::string& text, const std::string& answer,
                     const std::string& caller, QuestionId& id);
  Error RegisterUser (const std::string& caller);
  Error GrantEducator (const std::string& name, const std::string& caller);

  /* The methods below are read-only and free to call.  */

  Error CheckAnswer (QuestionId id, const std::string& candidate,
                     bool& correct) const;
  Error GetQuestion (QuestionId id, Question& q) const;
  std::vector<Question> ListQuestions () const;

  PowerLevel GetPowerLevel (const std::string& name) const;
  std::map<std::string, PowerLevel> ListRoles () const;

};

} // namespace quiz

#endif // QUIZ_CONTRACT_HPP
