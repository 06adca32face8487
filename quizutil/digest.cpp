// Copyright (C) 2018-2022 The Xaya developers
// Copyright (C) 2026 The quizchain developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "digest.hpp"

#include <algorithm>
#include <cstdint>

namespace quiz
{

constexpr size_t Digest::NUM_BYTES;

std::string
Digest::ToHex () const
{
  static constexpr char DIGITS[] = "0123456789abcdef";

  std::string result(NUM_BYTES * 2, 'x');
  for (size_t i = 0; i < NUM_BYTES; ++i)
    {
      const uint8_t val = data[i];
      result[2 * i] = DIGITS[val >> 4];
      result[2 * i + 1] = DIGITS[val % 0x10];
    }
  return result;
}

void
Digest::FromBlob (const unsigned char* blob)
{
  std::copy (blob, blob + NUM_BYTES, data.data ());
}

void
Digest::SetNull ()
{
  std::fill (data.begin (), data.end (), 0);
}

std::ostream&
operator<< (std::ostream& out, const Digest& d)
{
  out << d.ToHex ();
  return out;
}

} // namespace quiz
