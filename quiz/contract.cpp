// Copyright (C) 2026 The quizchain developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "contract.hpp"

#include <glog/logging.h>

namespace quiz
{

QuizContract::QuizContract (QuizStorage& s, const ContractConfig& config)
  : storage(s), access(s), store(s, access, config.MinAnswerLength)
{}

void
QuizContract::CheckInitialised () const
{
  CHECK (IsInitialised ()) << "The quiz has not been initialised";
}

bool
QuizContract::IsInitialised () const
{
  return storage.IsInitialised ();
}

Error
QuizContract::Initialise (const std::set<std::string>& educators)
{
  if (IsInitialised ())
    {
      LOG (WARNING) << "The quiz has already been initialised";
      return Error::ALREADY_INITIALISED;
    }

  if (educators.empty ())
    {
      LOG (WARNING) << "The quiz cannot be created without educators";
      return Error::NO_EDUCATORS;
    }

  ActiveTransaction tx(storage);
  access.Bootstrap (educators);
  storage.MarkInitialised ();
  tx.SetSuccess ();

  LOG (INFO) << "Created quiz with " << educators.size () << " educators";
  return Error::OK;
}

Error
QuizContract::AddQuestion (const std::string& text, const std::string& answer,
                           const std::string& caller, QuestionId& id)
{
  CheckInitialised ();

  ActiveTransaction tx(storage);
  const Error res = store.AddQuestion (text, answer, caller, id);
  if (res == Error::OK)
    tx.SetSuccess ();

  return res;
}

Error
QuizContract::RegisterUser (const std::string& caller)
{
  CheckInitialised ();

  ActiveTransaction tx(storage);
  const Error res = access.RegisterUser (caller);
  if (res == Error::OK)
    tx.SetSuccess ();

  return res;
}

Error
QuizContract::GrantEducator (const std::string& name,
                             const std::string& caller)
{
  CheckInitialised ();

  ActiveTransaction tx(storage);
  const Error res = access.GrantEducator (name, caller);
  if (res == Error::OK)
    tx.SetSuccess ();

  return res;
}

Error
QuizContract::CheckAnswer (const QuestionId id, const std::string& candidate,
                           bool& correct) const
{
  return store.CheckAnswer (id, candidate, correct);
}

Error
QuizContract::GetQuestion (const QuestionId id, Question& q) const
{
  return store.GetQuestion (id, q);
}

std::vector<Question>
QuizContract::ListQuestions () const
{
  return store.ListQuestions ();
}

PowerLevel
QuizContract::GetPowerLevel (const std::string& name) const
{
  return access.GetPowerLevel (name);
}

std::map<std::string, PowerLevel>
QuizContract::ListRoles () const
{
  return access.ListRoles ();
}

} // namespace quiz
