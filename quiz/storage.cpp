// Copyright (C) 2026 The quizchain developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "storage.hpp"

#include <glog/logging.h>

namespace quiz
{

void
QuizStorage::Initialise ()
{
  /* Nothing is done here, but can be overridden by subclasses.  */
}

ActiveTransaction::ActiveTransaction (QuizStorage& s)
  : storage(s)
{
  storage.BeginTransaction ();
}

ActiveTransaction::~ActiveTransaction ()
{
  if (success)
    storage.CommitTransaction ();
  else
    {
      VLOG (1) << "Rolling back unsuccessful transaction";
      storage.RollbackTransaction ();
    }
}

bool
MemoryQuizStorage::IsInitialised () const
{
  return current.initialised;
}

void
MemoryQuizStorage::MarkInitialised ()
{
  CHECK (backup != nullptr) << "No transaction is active";
  current.initialised = true;
}

PowerLevel
MemoryQuizStorage::GetPowerLevel (const std::string& name) const
{
  const auto mit = current.roles.find (name);
  if (mit == current.roles.end ())
    return PowerLevel::UNREGISTERED;

  return mit->second;
}

void
MemoryQuizStorage::SetPowerLevel (const std::string& name, const PowerLevel l)
{
  CHECK (backup != nullptr) << "No transaction is active";
  CHECK (l != PowerLevel::UNREGISTERED) << "Roles cannot be removed";
  current.roles[name] = l;
}

std::map<std::string, PowerLevel>
MemoryQuizStorage::GetAllRoles () const
{
  return current.roles;
}

QuestionId
MemoryQuizStorage::GetNumQuestions () const
{
  return current.questions.size ();
}

void
MemoryQuizStorage::AppendQuestion (const Question& q)
{
  CHECK (backup != nullptr) << "No transaction is active";
  CHECK_EQ (q.GetId (), current.questions.size ())
      << "Question ID is not the next in sequence";
  current.questions.push_back (q);
}

bool
MemoryQuizStorage::GetQuestion (const QuestionId id, Question& q) const
{
  if (id >= current.questions.size ())
    return false;

  q = current.questions[id];
  return true;
}

std::vector<Question>
MemoryQuizStorage::GetAllQuestions () const
{
  return current.questions;
}

void
MemoryQuizStorage::BeginTransaction ()
{
  CHECK (backup == nullptr) << "Transaction is already active";
  backup = std::make_unique<Data> (current);
}

void
MemoryQuizStorage::CommitTransaction ()
{
  CHECK (backup != nullptr) << "No transaction is active";
  backup.reset ();
}

void
MemoryQuizStorage::RollbackTransaction ()
{
  CHECK (backup != nullptr) << "No transaction is active";
  current = std::move (*backup);
  backup.reset ();
}

} // namespace quiz
