// Copyright (C) 2020 The Xaya developers
// Copyright (C) 2026 The quizchain developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "jsonutils.hpp"

#include <glog/logging.h>

#include <memory>

namespace quiz
{

bool
IsIntegerValue (const Json::Value& val)
{
  switch (val.type ())
    {
    case Json::intValue:
    case Json::uintValue:
      return true;

    default:
      return false;
    }
}

bool
Uint64FromJson (const Json::Value& val, uint64_t& res)
{
  if (!IsIntegerValue (val) || !val.isUInt64 ())
    return false;

  res = val.asUInt64 ();
  return true;
}

bool
ParseJsonString (const std::string& str, Json::Value& res)
{
  Json::CharReaderBuilder rbuilder;
  rbuilder["allowComments"] = false;
  rbuilder["strictRoot"] = false;
  rbuilder["failIfExtra"] = true;
  rbuilder["rejectDupKeys"] = true;

  std::unique_ptr<Json::CharReader> reader(rbuilder.newCharReader ());
  std::string parseErrs;
  if (!reader->parse (str.data (), str.data () + str.size (), &res,
                      &parseErrs))
    {
      VLOG (1) << "Failed parsing JSON:\n" << str << "\n" << parseErrs;
      return false;
    }

  return true;
}

} // namespace quiz
