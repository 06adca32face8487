// Copyright (C) 2026 The quizchain developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef QUIZ_HASHER_HPP
#define QUIZ_HASHER_HPP

#include "quizutil/digest.hpp"

#include <string>

namespace quiz
{

/**
 * Computes the commitment stored for an answer, i.e. the SHA-256 of its
 * raw bytes.  This is consensus-relevant:  it must never change, or else
 * answers to existing questions would no longer verify.
 */
Digest HashAnswer (const std::string& answer);

} // namespace quiz

#endif // QUIZ_HASHER_HPP
