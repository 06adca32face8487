// Copyright (C) 2026 The quizchain developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "error.hpp"

#include <glog/logging.h>

namespace quiz
{

std::string
ErrorToString (const Error e)
{
  switch (e)
    {
    case Error::OK:
      return "ok";
    case Error::UNAUTHORIZED:
      return "unauthorized";
    case Error::NOT_FOUND:
      return "not_found";
    case Error::ALREADY_INITIALISED:
      return "already_initialised";
    case Error::NO_EDUCATORS:
      return "no_educators";
    case Error::INVALID_ANSWER:
      return "invalid_answer";
    default:
      LOG (FATAL) << "Invalid error code: " << static_cast<int> (e);
    }
}

std::ostream&
operator<< (std::ostream& out, const Error e)
{
  out << ErrorToString (e);
  return out;
}

} // namespace quiz
