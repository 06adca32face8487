// Copyright (C) 2026 The quizchain developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "question.hpp"

#include "quizutil/jsonutils.hpp"

#include <cstdint>
#include <limits>

namespace quiz
{

Json::Value
QuestionIdToJson (const QuestionId id)
{
  /* Use a signed value where possible, matching what the JSON parser
     produces for integer literals.  */
  if (id <= static_cast<uint64_t> (std::numeric_limits<Json::Int64>::max ()))
    return static_cast<Json::Int64> (id);

  return static_cast<Json::UInt64> (id);
}

bool
QuestionIdFromJson (const Json::Value& val, QuestionId& id)
{
  uint64_t res;
  if (!Uint64FromJson (val, res))
    return false;

  id = res;
  return true;
}

Json::Value
Question::ToJson () const
{
  Json::Value res(Json::objectValue);
  res["id"] = QuestionIdToJson (id);
  res["text"] = text;
  res["answerhash"] = answerHash.ToHex ();
  return res;
}

} // namespace quiz
