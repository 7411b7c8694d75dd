#pragma once

#include <string>

namespace mcp_remote::oauth {

// PKCE (Proof Key for Code Exchange), S256 only
struct PkceChallenge {
  std::string code_verifier;   // base64url(32 random bytes), 43 chars
  std::string code_challenge;  // base64url(SHA256(code_verifier)), 43 chars
  std::string code_challenge_method = "S256";

  // Generate a new PKCE challenge pair.
  // Throws std::runtime_error if the system CSPRNG fails.
  static PkceChallenge generate();
};

// Recompute the S256 challenge from a verifier and compare
bool verify_pkce_challenge(const std::string& code_verifier, const std::string& code_challenge);

std::string compute_code_challenge(const std::string& code_verifier);

// Base64URL without padding
std::string base64url_encode(const unsigned char* data, size_t len);

std::string base64url_encode(const std::string& data);

// Random opaque value for the OAuth state parameter
std::string generate_state();

// Constant-time string comparison
bool constant_time_equals(const std::string& a, const std::string& b);

}  // namespace mcp_remote::oauth
