// Copyright (C) 2019 The Xaya developers
// Copyright (C) 2026 The quizchain developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef QUIZUTIL_HASH_HPP
#define QUIZUTIL_HASH_HPP

#include "digest.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace quiz
{

/**
 * Streaming SHA-256 hasher.  It is used for the answer commitments of
 * questions and for fingerprinting the quiz state.
 */
class SHA256
{

private:

  /**
   * Holder for the internal state.  This is not exposed here in the header,
   * so that the dependency on OpenSSL is kept as an implementation detail.
   */
  class State;

  /** The underlying current state of the hasher.  */
  std::unique_ptr<State> state;

public:

  SHA256 ();
  ~SHA256 ();

  SHA256 (const SHA256&) = delete;
  void operator= (const SHA256&) = delete;

  /**
   * Adds the raw bytes of a string (without any length prefix).
   */
  SHA256& operator<< (const std::string& data);

  SHA256& operator<< (const Digest& data);

  /**
   * Adds an integer as eight big-endian bytes.
   */
  SHA256& operator<< (uint64_t num);

  /**
   * Finalises the hash and returns the resulting value.  After this
   * function has been called, no more operations on the instance
   * are allowed.
   */
  Digest Finalise ();

  /**
   * Hashes a single string and returns the result.
   */
  static Digest Hash (const std::string& data);

};

} // namespace quiz

#endif // QUIZUTIL_HASH_HPP
