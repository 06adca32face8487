// Copyright (C) 2026 The quizchain developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "accesscontrol.hpp"

#include <glog/logging.h>

namespace quiz
{

PowerLevel
AccessControl::GetPowerLevel (const std::string& name) const
{
  return storage.GetPowerLevel (name);
}

void
AccessControl::Bootstrap (const std::set<std::string>& educators)
{
  for (const auto& e : educators)
    {
      LOG (INFO) << "Initial educator: " << e;
      storage.SetPowerLevel (e, PowerLevel::EDUCATOR);
    }
}

Error
AccessControl::GrantEducator (const std::string& name,
                              const std::string& requester)
{
  if (GetPowerLevel (requester) != PowerLevel::EDUCATOR)
    {
      LOG (WARNING)
          << requester << " is not an educator and cannot grant the role to "
          << name;
      return Error::UNAUTHORIZED;
    }

  const PowerLevel old = GetPowerLevel (name);
  if (old == PowerLevel::EDUCATOR)
    {
      VLOG (1) << name << " is already an educator";
      return Error::OK;
    }

  storage.SetPowerLevel (name, PowerLevel::EDUCATOR);
  LOG (INFO)
      << requester << " made " << name << " an educator"
      << " (previously " << old << ")";

  return Error::OK;
}

Error
AccessControl::RegisterUser (const std::string& name)
{
  const PowerLevel old = GetPowerLevel (name);
  switch (old)
    {
    case PowerLevel::UNREGISTERED:
      storage.SetPowerLevel (name, PowerLevel::USER);
      LOG (INFO) << "Registered new user " << name;
      break;

    case PowerLevel::USER:
      VLOG (1) << name << " is already registered";
      break;

    case PowerLevel::EDUCATOR:
      VLOG (1) << name << " is an educator, not registering as user";
      break;

    default:
      LOG (FATAL) << "Unexpected power level: " << static_cast<int> (old);
    }

  return Error::OK;
}

std::map<std::string, PowerLevel>
AccessControl::ListRoles () const
{
  return storage.GetAllRoles ();
}

} // namespace quiz
