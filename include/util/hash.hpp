// Copyright (c) 2025 The spvproof developers
// Distributed under the MIT software license

#pragma once

#include "util/uint.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>

struct evp_md_ctx_st;

/**
 * SHA-256 hasher backed by OpenSSL's EVP digest API.
 *
 * Usage mirrors Bitcoin Core's CSHA256:
 *   CSHA256().Write(data, len).Finalize(out);
 *
 * Throws std::runtime_error if OpenSSL cannot allocate or run the digest.
 */
class CSHA256 {
public:
  static constexpr size_t OUTPUT_SIZE = 32;

  CSHA256();
  ~CSHA256();

  CSHA256(const CSHA256 &) = delete;
  CSHA256 &operator=(const CSHA256 &) = delete;

  CSHA256 &Write(const unsigned char *data, size_t len);
  void Finalize(unsigned char hash[OUTPUT_SIZE]);
  CSHA256 &Reset();

private:
  struct CtxDeleter {
    void operator()(evp_md_ctx_st *ctx) const noexcept;
  };
  std::unique_ptr<evp_md_ctx_st, CtxDeleter> ctx_;
};

/** Bitcoin's hash256: SHA-256 applied twice. Headers and Merkle nodes. */
class CHash256 {
public:
  static constexpr size_t OUTPUT_SIZE = CSHA256::OUTPUT_SIZE;

  CHash256 &Write(std::span<const unsigned char> input) {
    sha_.Write(input.data(), input.size());
    return *this;
  }

  void Finalize(std::span<unsigned char> output);

  CHash256 &Reset() {
    sha_.Reset();
    return *this;
  }

private:
  CSHA256 sha_;
};

// hash256 of an arbitrary buffer, result in internal byte order
[[nodiscard]] uint256 Hash256(std::span<const unsigned char> input);

// hash256 of the raw 64-byte concatenation left ++ right (Merkle node)
[[nodiscard]] uint256 Hash256(const uint256 &left, const uint256 &right);
