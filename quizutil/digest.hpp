// Copyright (C) 2018-2022 The Xaya developers
// Copyright (C) 2026 The quizchain developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef QUIZUTIL_DIGEST_HPP
#define QUIZUTIL_DIGEST_HPP

#include <array>
#include <ostream>
#include <string>

namespace quiz
{

/**
 * A 256-bit hash value as produced by SHA-256.  It is used to store the
 * commitments to answers of questions and to fingerprint the full quiz
 * state.  Values can be compared, printed as hex and stored as raw bytes,
 * but not manipulated otherwise.
 */
class Digest final
{

public:

  static constexpr size_t NUM_BYTES = 256 / 8;

private:

  using Array = std::array<unsigned char, NUM_BYTES>;

  /** The raw bytes in the order in which the hash function outputs them.  */
  Array data;

public:

  Digest () = default;
  Digest (const Digest&) = default;
  Digest (Digest&&) = default;

  Digest& operator= (const Digest&) = default;
  Digest& operator= (Digest&&) = default;

  /**
   * Converts the digest to a lower-case hex string.
   */
  std::string ToHex () const;

  /**
   * Returns a pointer to the raw bytes.  Its length is NUM_BYTES.
   */
  const unsigned char*
  GetBlob () const
  {
    return data.data ();
  }

  /**
   * Sets the data from a raw blob of bytes, which must be of length NUM_BYTES.
   */
  void FromBlob (const unsigned char* blob);

  /**
   * Sets the value to all-zeros.
   */
  void SetNull ();

  friend bool
  operator== (const Digest& a, const Digest& b)
  {
    return a.data == b.data;
  }

  friend bool
  operator!= (const Digest& a, const Digest& b)
  {
    return !(a == b);
  }

  friend bool
  operator< (const Digest& a, const Digest& b)
  {
    return a.data < b.data;
  }

  /**
   * Writes the hex representation to a stream, for logging.
   */
  friend std::ostream& operator<< (std::ostream& out, const Digest& d);

};

} // namespace quiz

#endif // QUIZUTIL_DIGEST_HPP
