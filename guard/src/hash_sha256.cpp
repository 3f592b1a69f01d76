#include "hash_sha256.h"
#include <openssl/sha.h>

static std::string hex(const unsigned char* d, size_t n) {
  static const char* he = "0123456789abcdef";
  std::string s; s.resize(n*2);
  for (size_t i=0;i<n;++i){ s[2*i]=he[d[i]>>4]; s[2*i+1]=he[d[i]&0xF]; }
  return s;
}

std::string sha256_string(const std::string& str) {
  unsigned char md[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char*>(str.data()), str.size(), md);
  return hex(md, sizeof(md));
}

std::string short_digest(const std::string& str, size_t n) {
  std::string full = sha256_string(str);
  if (n < full.size()) full.resize(n);
  return full;
}
