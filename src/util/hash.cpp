// Copyright (c) 2025 The spvproof developers
// Distributed under the MIT software license

#include "util/hash.hpp"
#include "util/logging.hpp"

#include <openssl/evp.h>

#include <cassert>
#include <stdexcept>

void CSHA256::CtxDeleter::operator()(evp_md_ctx_st *ctx) const noexcept {
  EVP_MD_CTX_free(ctx);
}

CSHA256::CSHA256() : ctx_(EVP_MD_CTX_new()) {
  if (!ctx_) {
    LOG_CRYPTO_ERROR("EVP_MD_CTX_new returned null");
    throw std::runtime_error("Failed to allocate EVP_MD_CTX");
  }
  Reset();
}

CSHA256::~CSHA256() = default;

CSHA256 &CSHA256::Reset() {
  if (EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) <= 0) {
    throw std::runtime_error("EVP_DigestInit_ex(sha256) failed");
  }
  return *this;
}

CSHA256 &CSHA256::Write(const unsigned char *data, size_t len) {
  if (len == 0) {
    return *this;
  }
  if (EVP_DigestUpdate(ctx_.get(), data, len) <= 0) {
    throw std::runtime_error("EVP_DigestUpdate failed");
  }
  return *this;
}

void CSHA256::Finalize(unsigned char hash[OUTPUT_SIZE]) {
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(ctx_.get(), hash, &len) <= 0 || len != OUTPUT_SIZE) {
    LOG_CRYPTO_ERROR("EVP_DigestFinal_ex failed (digest length {})", len);
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }
}

void CHash256::Finalize(std::span<unsigned char> output) {
  assert(output.size() == OUTPUT_SIZE);
  unsigned char buf[CSHA256::OUTPUT_SIZE];
  sha_.Finalize(buf);
  sha_.Reset().Write(buf, CSHA256::OUTPUT_SIZE).Finalize(output.data());
}

uint256 Hash256(std::span<const unsigned char> input) {
  uint256 result;
  CHash256().Write(input).Finalize(result);
  return result;
}

uint256 Hash256(const uint256 &left, const uint256 &right) {
  uint256 result;
  CHash256().Write(left).Write(right).Finalize(result);
  return result;
}
