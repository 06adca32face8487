// Copyright (C) 2026 The quizchain developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef QUIZ_ERROR_HPP
#define QUIZ_ERROR_HPP

#include <ostream>
#include <string>

namespace quiz
{

/**
 * Result codes of the quiz entry points.  Anything other than OK means
 * that the invocation did not change the state.
 */
enum class Error
{
  OK = 0,

  /** The caller does not have the power level required.  */
  UNAUTHORIZED,

  /** The referenced question does not exist.  */
  NOT_FOUND,

  /** The quiz has been initialised before.  */
  ALREADY_INITIALISED,

  /** The quiz would be created without any educator.  */
  NO_EDUCATORS,

  /** The answer of a new question is rejected by the answer policy.  */
  INVALID_ANSWER,
};

/**
 * Converts an error code to a string, as used in log messages and
 * JSON results.
 */
std::string ErrorToString (Error e);

std::ostream& operator<< (std::ostream& out, Error e);

} // namespace quiz

#endif // QUIZ_ERROR_HPP
