#include "oauth/pkce.hpp"

#include <openssl/crypto.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

#include <stdexcept>

namespace mcp_remote::oauth {

namespace {

constexpr size_t kRandomBytes = 32;

std::string random_token() {
  unsigned char bytes[kRandomBytes];
  if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
    throw std::runtime_error("RAND_bytes failed: system random generator unavailable");
  }
  return base64url_encode(bytes, sizeof(bytes));
}

}  // namespace

std::string base64url_encode(const unsigned char* data, size_t len) {
  static const char base64url_table[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

  std::string out;
  out.reserve((len * 4 + 2) / 3);

  size_t i = 0;
  for (i = 0; i + 2 < len; i += 3) {
    uint32_t triple = (data[i] << 16) | (data[i + 1] << 8) | data[i + 2];
    out += base64url_table[(triple >> 18) & 0x3F];
    out += base64url_table[(triple >> 12) & 0x3F];
    out += base64url_table[(triple >> 6) & 0x3F];
    out += base64url_table[triple & 0x3F];
  }
  // 1 or 2 trailing bytes, no padding
  if (i < len) {
    uint32_t triple = data[i] << 16;
    if (i + 1 < len) {
      triple |= data[i + 1] << 8;
    }
    out += base64url_table[(triple >> 18) & 0x3F];
    out += base64url_table[(triple >> 12) & 0x3F];
    if (i + 1 < len) {
      out += base64url_table[(triple >> 6) & 0x3F];
    }
  }

  return out;
}

std::string base64url_encode(const std::string& data) {
  return base64url_encode(reinterpret_cast<const unsigned char*>(data.data()), data.size());
}

std::string compute_code_challenge(const std::string& code_verifier) {
  unsigned char hash[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char*>(code_verifier.c_str()), code_verifier.size(), hash);
  return base64url_encode(hash, SHA256_DIGEST_LENGTH);
}

PkceChallenge PkceChallenge::generate() {
  PkceChallenge challenge;
  challenge.code_verifier = random_token();
  challenge.code_challenge = compute_code_challenge(challenge.code_verifier);
  return challenge;
}

bool verify_pkce_challenge(const std::string& code_verifier, const std::string& code_challenge) {
  return constant_time_equals(compute_code_challenge(code_verifier), code_challenge);
}

std::string generate_state() {
  return random_token();
}

bool constant_time_equals(const std::string& a, const std::string& b) {
  if (a.size() != b.size()) {
    return false;
  }
  return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

}  // namespace mcp_remote::oauth
