// Copyright (C) 2026 The quizchain developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "statejson.hpp"

#include "quizutil/hash.hpp"

#include <glog/logging.h>

namespace quiz
{

Json::Value
StateJsonExtractor::ListQuestions () const
{
  Json::Value res(Json::arrayValue);
  for (const auto& q : contract.ListQuestions ())
    {
      Json::Value cur(Json::objectValue);
      cur["id"] = QuestionIdToJson (q.GetId ());
      cur["text"] = q.GetText ();
      res.append (cur);
    }

  return res;
}

Json::Value
StateJsonExtractor::GetQuestion (const QuestionId id) const
{
  Question q;
  if (contract.GetQuestion (id, q) != Error::OK)
    return Json::Value ();

  return q.ToJson ();
}

Json::Value
StateJsonExtractor::CheckAnswer (const QuestionId id,
                                 const std::string& answer) const
{
  Json::Value res(Json::objectValue);

  bool correct;
  const Error err = contract.CheckAnswer (id, answer, correct);
  if (err == Error::OK)
    res["correct"] = correct;
  else
    res["error"] = ErrorToString (err);

  return res;
}

Json::Value
StateJsonExtractor::GetPowerLevel (const std::string& name) const
{
  return PowerLevelToString (contract.GetPowerLevel (name));
}

Json::Value
StateJsonExtractor::FullState () const
{
  Json::Value questions(Json::arrayValue);
  for (const auto& q : contract.ListQuestions ())
    questions.append (q.ToJson ());

  Json::Value roles(Json::objectValue);
  for (const auto& entry : contract.ListRoles ())
    roles[entry.first] = PowerLevelToString (entry.second);

  Json::Value res(Json::objectValue);
  res["initialised"] = contract.IsInitialised ();
  res["questions"] = questions;
  res["roles"] = roles;

  return res;
}

Digest
StateJsonExtractor::HashState () const
{
  /* Strings are prefixed with their length, so that the serialisation
     is unambiguous.  */
  SHA256 hasher;
  hasher << "quiz state\n";
  hasher << static_cast<uint64_t> (contract.IsInitialised () ? 1 : 0);

  const auto questions = contract.ListQuestions ();
  hasher << static_cast<uint64_t> (questions.size ());
  for (const auto& q : questions)
    {
      hasher << q.GetId ();
      hasher << static_cast<uint64_t> (q.GetText ().size ()) << q.GetText ();
      hasher << q.GetAnswerHash ();
    }

  const auto roles = contract.ListRoles ();
  hasher << static_cast<uint64_t> (roles.size ());
  for (const auto& entry : roles)
    {
      const std::string level = PowerLevelToString (entry.second);
      hasher << static_cast<uint64_t> (entry.first.size ()) << entry.first;
      hasher << static_cast<uint64_t> (level.size ()) << level;
    }

  const Digest res = hasher.Finalise ();
  VLOG (1) << "Hash of quiz state: " << res;

  return res;
}

} // namespace quiz
