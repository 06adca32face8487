// Copyright (C) 2019-2023 The Xaya developers
// Copyright (C) 2026 The quizchain developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "hash.hpp"

#include <glog/logging.h>

#include <openssl/evp.h>

#include <cstddef>

namespace quiz
{

namespace
{

constexpr size_t SHA256_DIGEST_LEN = 32;

} // anonymous namespace

/**
 * The actual implementation for the SHA256 state, wrapping an OpenSSL
 * EVP digest context.
 */
class SHA256::State
{

private:

  /** The digest to use (SHA-256).  */
  const EVP_MD* const digest;

  /** The underlying OpenSSL context.  */
  EVP_MD_CTX* ctx;

public:

  State ();
  ~State ();

  State (const State&) = delete;
  void operator= (const State&) = delete;

  void Update (const unsigned char* data, size_t len);
  void Finalise (unsigned char* out);

};

SHA256::State::State ()
  : digest(EVP_sha256 ()), ctx(EVP_MD_CTX_new ())
{
  CHECK (digest != nullptr);
  CHECK (ctx != nullptr);
  CHECK_EQ (EVP_DigestInit_ex (ctx, digest, nullptr), 1);
}

SHA256::State::~State ()
{
  EVP_MD_CTX_free (ctx);
}

void
SHA256::State::Update (const unsigned char* data, const size_t len)
{
  CHECK_EQ (EVP_DigestUpdate (ctx, data, len), 1);
}

void
SHA256::State::Finalise (unsigned char* out)
{
  unsigned outlen;
  CHECK_EQ (EVP_DigestFinal_ex (ctx, out, &outlen), 1);
  CHECK_EQ (outlen, SHA256_DIGEST_LEN);
}

SHA256::SHA256 ()
{
  state = std::make_unique<State> ();
}

SHA256::~SHA256 () = default;

SHA256&
SHA256::operator<< (const std::string& data)
{
  CHECK (state != nullptr) << "Hasher has already been finalised";
  state->Update (reinterpret_cast<const unsigned char*> (data.data ()),
                 data.size ());
  return *this;
}

SHA256&
SHA256::operator<< (const Digest& data)
{
  CHECK (state != nullptr) << "Hasher has already been finalised";
  state->Update (data.GetBlob (), Digest::NUM_BYTES);
  return *this;
}

SHA256&
SHA256::operator<< (const uint64_t num)
{
  CHECK (state != nullptr) << "Hasher has already been finalised";

  unsigned char bytes[8];
  for (int i = 7; i >= 0; --i)
    bytes[7 - i] = static_cast<unsigned char> ((num >> (8 * i)) & 0xFF);
  state->Update (bytes, sizeof (bytes));

  return *this;
}

Digest
SHA256::Finalise ()
{
  static_assert (SHA256_DIGEST_LEN == Digest::NUM_BYTES,
                 "Digest is not a valid output for SHA-256");

  CHECK (state != nullptr) << "Hasher has already been finalised";

  unsigned char data[SHA256_DIGEST_LEN];
  state->Finalise (data);
  state.reset ();

  Digest res;
  res.FromBlob (data);

  return res;
}

Digest
SHA256::Hash (const std::string& data)
{
  SHA256 hasher;
  hasher << data;
  return hasher.Finalise ();
}

} // namespace quiz
