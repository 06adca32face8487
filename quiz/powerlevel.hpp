// Copyright (C) 2026 The quizchain developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef QUIZ_POWERLEVEL_HPP
#define QUIZ_POWERLEVEL_HPP

#include <ostream>
#include <string>

namespace quiz
{

/**
 * The role an identity holds in the quiz.  Each identity has at most one
 * explicit role; UNREGISTERED is what everyone without one has.
 */
enum class PowerLevel
{
  UNREGISTERED = 0,
  USER,
  EDUCATOR,
};

/**
 * Converts a power level to its string name, as used in the database
 * and the JSON state.
 */
std::string PowerLevelToString (PowerLevel l);

/**
 * Parses a string name into a power level.  Returns false if the
 * string is not a known name.
 */
bool PowerLevelFromString (const std::string& str, PowerLevel& l);

std::ostream& operator<< (std::ostream& out, PowerLevel l);

} // namespace quiz

#endif // QUIZ_POWERLEVEL_HPP
