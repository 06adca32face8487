// Copyright (C) 2026 The quizchain developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "testutils.hpp"

#include <glog/logging.h>

#include <sstream>

namespace quiz
{

Json::Value
ParseJson (const std::string& val)
{
  std::istringstream in(val);
  Json::Value res;
  in >> res;
  return res;
}

constexpr const char* QuizTest::EDUCATOR;

QuizTest::QuizTest ()
  : storage(":memory:"), contract(storage)
{
  storage.Initialise ();
  CHECK_EQ (contract.Initialise ({EDUCATOR}), Error::OK);
}

QuestionId
QuizTest::AddQuestion (const std::string& text, const std::string& answer)
{
  QuestionId id;
  CHECK_EQ (contract.AddQuestion (text, answer, EDUCATOR, id), Error::OK);
  return id;
}

} // namespace quiz
