// Copyright (C) 2020 The Xaya developers
// Copyright (C) 2026 The quizchain developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef QUIZUTIL_JSONUTILS_HPP
#define QUIZUTIL_JSONUTILS_HPP

#include <json/json.h>

#include <cstdint>
#include <string>

namespace quiz
{

/**
 * Returns true if the given JSON value is a true integer, i.e. really
 * was parsed from an integer literal.  This is in contrast to a value that
 * has isInt() return true, but was actually parsed from a floating-point
 * literal and just happens to be integral.
 */
bool IsIntegerValue (const Json::Value& val);

/**
 * Parses a non-negative integer given as integer literal in JSON.
 * Returns false if the value is of any other type or negative.
 */
bool Uint64FromJson (const Json::Value& val, uint64_t& res);

/**
 * Parses a string as JSON.  Returns false if it is not valid JSON.
 */
bool ParseJsonString (const std::string& str, Json::Value& res);

} // namespace quiz

#endif // QUIZUTIL_JSONUTILS_HPP
