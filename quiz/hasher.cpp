// Copyright (C) 2026 The quizchain developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "hasher.hpp"

#include "quizutil/hash.hpp"

namespace quiz
{

Digest
HashAnswer (const std::string& answer)
{
  return SHA256::Hash (answer);
}

} // namespace quiz
