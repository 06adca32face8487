// Copyright (C) 2026 The quizchain developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "hasher.hpp"

#include <gtest/gtest.h>

#include <string>

namespace quiz
{
namespace
{

TEST (HasherTests, Deterministic)
{
  EXPECT_EQ (HashAnswer ("Paris"), HashAnswer ("Paris"));
  EXPECT_EQ (HashAnswer ("").ToHex (),
             "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  EXPECT_EQ (HashAnswer ("4").ToHex (),
             "4b227777d4dd1fc61c6f884f48641d02b4d121d3fd328cb08b5531fcacdabf8a");
}

TEST (HasherTests, DistinctAnswers)
{
  const std::string answers[] = {"", "4", "four", "Four", "4 ", "Paris"};
  for (const auto& a : answers)
    for (const auto& b : answers)
      if (a != b)
        EXPECT_NE (HashAnswer (a), HashAnswer (b)) << a << " vs " << b;
}

TEST (HasherTests, BinaryAnswer)
{
  const std::string withNul("a\0b", 3);
  EXPECT_NE (HashAnswer (withNul), HashAnswer ("a"));
  EXPECT_EQ (HashAnswer (withNul), HashAnswer (std::string ("a\0b", 3)));
}

} // anonymous namespace
} // namespace quiz
