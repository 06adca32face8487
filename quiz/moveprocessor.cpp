// Copyright (C) 2026 The quizchain developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "moveprocessor.hpp"

#include <glog/logging.h>

namespace quiz
{

void
MoveProcessor::HandleOperation (const std::string& name, const Json::Value& mv)
{
  CHECK (mv.isObject ());

  /* Operations may contain the plain-text answer of a new question,
     so they are not written to the log in full.  */
  if (mv.size () != 1)
    {
      LOG (WARNING)
          << "Invalid operation from " << name
          << " with " << mv.size () << " fields";
      return;
    }

  if (mv.isMember ("q"))
    HandleAddQuestion (name, mv["q"]);
  else if (mv.isMember ("r"))
    HandleRegister (name, mv["r"]);
  else if (mv.isMember ("e"))
    HandleGrantEducator (name, mv["e"]);
  else
    LOG (WARNING)
        << "Invalid operation from " << name
        << ": " << mv.getMemberNames ().front ();
}

void
MoveProcessor::HandleAddQuestion (const std::string& name,
                                  const Json::Value& op)
{
  if (!op.isObject () || op.size () != 2
        || !op["t"].isString () || !op["a"].isString ())
    {
      LOG (WARNING) << "Invalid add-question operation from " << name;
      return;
    }

  QuestionId id;
  const Error res = contract.AddQuestion (op["t"].asString (),
                                          op["a"].asString (), name, id);
  if (res != Error::OK)
    LOG (WARNING) << "Adding question by " << name << " failed: " << res;
}

void
MoveProcessor::HandleRegister (const std::string& name, const Json::Value& op)
{
  if (!op.isObject () || !op.empty ())
    {
      LOG (WARNING) << "Invalid register operation: " << op;
      return;
    }

  const Error res = contract.RegisterUser (name);
  if (res != Error::OK)
    LOG (WARNING) << "Registering " << name << " failed: " << res;
}

void
MoveProcessor::HandleGrantEducator (const std::string& name,
                                    const Json::Value& op)
{
  if (!op.isString ())
    {
      LOG (WARNING) << "Invalid grant-educator operation: " << op;
      return;
    }

  const std::string target = op.asString ();
  const Error res = contract.GrantEducator (target, name);
  if (res != Error::OK)
    LOG (WARNING)
        << "Granting educator role to " << target << " by " << name
        << " failed: " << res;
}

void
MoveProcessor::ProcessOne (const Json::Value& obj)
{
  if (!obj.isObject ())
    {
      LOG (WARNING) << "Ignoring move that is not a JSON object";
      return;
    }

  const auto& nameVal = obj["name"];
  if (!nameVal.isString ())
    {
      LOG (WARNING) << "Ignoring move without a valid sender name";
      return;
    }
  const std::string name = nameVal.asString ();

  const auto& mv = obj["move"];

  if (mv.isObject ())
    HandleOperation (name, mv);
  else if (mv.isArray ())
    {
      for (const auto& op : mv)
        {
          if (op.isObject ())
            HandleOperation (name, op);
          else
            LOG (WARNING)
                << "Invalid operation inside array move from " << name;
        }
    }
  else
    LOG (WARNING) << "Invalid move from " << name;
}

void
MoveProcessor::ProcessAll (const Json::Value& moves)
{
  CHECK (moves.isArray ());
  LOG_IF (INFO, !moves.empty ())
      << "Processing " << moves.size () << " moves...";
  for (const auto& mv : moves)
    ProcessOne (mv);
}

} // namespace quiz
