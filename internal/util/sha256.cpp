#include "sha256.hpp"

#include <openssl/evp.h>
#include <openssl/sha.h>

#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace credpool::util {

std::string Sha256Hex(std::string_view data) {
  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!ctx) {
    throw std::runtime_error("sha256: EVP_MD_CTX_new failed");
  }

  unsigned char hash[SHA256_DIGEST_LENGTH];
  unsigned int  hash_len = 0;
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 || EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
      EVP_DigestFinal_ex(ctx.get(), hash, &hash_len) != 1) {
    throw std::runtime_error("sha256: digest failed");
  }

  std::ostringstream oss;
  for (unsigned int i = 0; i < hash_len; ++i) {
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
  }
  return oss.str();
}

} // namespace credpool::util
