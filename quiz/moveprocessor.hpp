// Copyright (C) 2026 The quizchain developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef QUIZ_MOVEPROCESSOR_HPP
#define QUIZ_MOVEPROCESSOR_HPP

#include "contract.hpp"

#include <json/json.h>

#include <string>

namespace quiz
{

/**
 * Parses moves delivered by the host (i.e. the paid invocations, each
 * with the name of its sender) and applies them through the contract.
 * Invalid moves are ignored.
 */
class MoveProcessor
{

private:

  /** The contract to which moves are applied.  */
  QuizContract& contract;

  /**
   * Handles an individual operation (i.e. a move that is a JSON object,
   * or an element of an array move).
   */
  void HandleOperation (const std::string& name, const Json::Value& mv);

  /**
   * Handles adding of a question, i.e. a move's "q" part.
   */
  void HandleAddQuestion (const std::string& name, const Json::Value& op);

  /**
   * Handles registration of the sender, i.e. a move's "r" part.
   */
  void HandleRegister (const std::string& name, const Json::Value& op);

  /**
   * Handles granting of the educator role, i.e. a move's "e" part.
   */
  void HandleGrantEducator (const std::string& name, const Json::Value& op);

public:

  explicit MoveProcessor (QuizContract& c)
    : contract(c)
  {}

  MoveProcessor () = delete;
  MoveProcessor (const MoveProcessor&) = delete;
  void operator= (const MoveProcessor&) = delete;

  /**
   * Processes a single move given as JSON object with both the sender
   * name and the actual move.  Entries that are not of this form are
   * logged and skipped.
   */
  void ProcessOne (const Json::Value& obj);

  /**
   * Processes all moves from a given JSON array.
   */
  void ProcessAll (const Json::Value& moves);

};

} // namespace quiz

#endif // QUIZ_MOVEPROCESSOR_HPP
