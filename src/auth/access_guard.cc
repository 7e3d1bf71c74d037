#define MCPGATE_LOG_COMPONENT "auth.guard"

#include "mcpgate/auth/access_guard.h"

#include <stdexcept>
#include <vector>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include "mcpgate/logging/log_macros.h"

namespace mcpgate {
namespace auth {

namespace {

const char* const kProtectedPrefixes[] = {"/mcp", "/auth", "/tools"};

}  // namespace

std::string base64UrlEncode(const std::string& data) {
  if (data.empty()) {
    return std::string();
  }
  // EVP_EncodeBlock writes 4 bytes per 3 input bytes plus a terminator
  std::vector<unsigned char> out(((data.size() + 2) / 3) * 4 + 1);
  int written = EVP_EncodeBlock(
      out.data(), reinterpret_cast<const unsigned char*>(data.data()),
      static_cast<int>(data.size()));

  std::string encoded(reinterpret_cast<char*>(out.data()),
                      static_cast<size_t>(written));
  while (!encoded.empty() && encoded.back() == '=') {
    encoded.pop_back();
  }
  for (auto& c : encoded) {
    if (c == '+') {
      c = '-';
    } else if (c == '/') {
      c = '_';
    }
  }
  return encoded;
}

std::string generateUrlSafeToken(size_t num_bytes) {
  std::string raw(num_bytes, '\0');
  if (RAND_bytes(reinterpret_cast<unsigned char*>(&raw[0]),
                 static_cast<int>(num_bytes)) != 1) {
    throw std::runtime_error("RAND_bytes failed to produce random data");
  }
  return base64UrlEncode(raw);
}

std::string maskSecret(const std::string& secret) {
  if (secret.empty()) {
    return "<empty>";
  }
  if (secret.size() <= 8) {
    return "****";
  }
  return secret.substr(0, 4) + "****";
}

AccessGuard::AccessGuard(const std::string& secret) : secret_(secret) {
  if (secret_.empty()) {
    throw std::invalid_argument("access guard secret must not be empty");
  }
  MCPGATE_LOG(Debug, "Access guard armed with key {}", maskSecret(secret_));
}

bool AccessGuard::authorize(const std::string& presented) const {
  if (presented.empty() || presented.size() != secret_.size()) {
    return false;
  }
  return CRYPTO_memcmp(presented.data(), secret_.data(), secret_.size()) == 0;
}

bool AccessGuard::requiresCredential(const std::string& path) {
  for (const char* prefix : kProtectedPrefixes) {
    if (path.compare(0, std::char_traits<char>::length(prefix), prefix) ==
        0) {
      return true;
    }
  }
  return false;
}

}  // namespace auth
}  // namespace mcpgate
