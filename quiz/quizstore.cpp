// Copyright (C) 2026 The quizchain developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "quizstore.hpp"

#include "hasher.hpp"

#include <glog/logging.h>

namespace quiz
{

Error
QuizStore::AddQuestion (const std::string& text, const std::string& answer,
                        const std::string& requester, QuestionId& id)
{
  if (access.GetPowerLevel (requester) != PowerLevel::EDUCATOR)
    {
      LOG (WARNING)
          << requester << " is not an educator and cannot add questions";
      return Error::UNAUTHORIZED;
    }

  if (answer.size () < minAnswerLength)
    {
      LOG (WARNING)
          << "Answer for new question by " << requester << " is too short"
          << " (" << answer.size () << " < " << minAnswerLength << " bytes)";
      return Error::INVALID_ANSWER;
    }

  const QuestionId newId = storage.GetNumQuestions ();
  storage.AppendQuestion (Question (newId, text, HashAnswer (answer)));
  LOG (INFO) << requester << " added question " << newId << ": " << text;

  id = newId;
  return Error::OK;
}

Error
QuizStore::CheckAnswer (const QuestionId id, const std::string& candidate,
                        bool& correct) const
{
  Question q;
  const Error res = GetQuestion (id, q);
  if (res != Error::OK)
    return res;

  correct = (HashAnswer (candidate) == q.GetAnswerHash ());
  VLOG (1)
      << "Checked answer for question " << id << ": "
      << (correct ? "correct" : "wrong");

  return Error::OK;
}

Error
QuizStore::GetQuestion (const QuestionId id, Question& q) const
{
  if (!storage.GetQuestion (id, q))
    {
      VLOG (1) << "Question " << id << " does not exist";
      return Error::NOT_FOUND;
    }

  CHECK_EQ (q.GetId (), id);
  return Error::OK;
}

std::vector<Question>
QuizStore::ListQuestions () const
{
  return storage.GetAllQuestions ();
}

} // namespace quiz
