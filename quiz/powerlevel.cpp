// Copyright (C) 2026 The quizchain developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "powerlevel.hpp"

#include <glog/logging.h>

namespace quiz
{

std::string
PowerLevelToString (const PowerLevel l)
{
  switch (l)
    {
    case PowerLevel::UNREGISTERED:
      return "unregistered";
    case PowerLevel::USER:
      return "user";
    case PowerLevel::EDUCATOR:
      return "educator";
    default:
      LOG (FATAL) << "Invalid power level: " << static_cast<int> (l);
    }
}

bool
PowerLevelFromString (const std::string& str, PowerLevel& l)
{
  for (const auto cur : {PowerLevel::UNREGISTERED, PowerLevel::USER,
                         PowerLevel::EDUCATOR})
    if (str == PowerLevelToString (cur))
      {
        l = cur;
        return true;
      }

  return false;
}

std::ostream&
operator<< (std::ostream& out, const PowerLevel l)
{
  out << PowerLevelToString (l);
  return out;
}

} // namespace quiz
