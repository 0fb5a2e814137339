#include "sage_core/services/document_identity.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace sage_core {

namespace {

std::string to_hex(const unsigned char *data, size_t length) {
  std::stringstream ss;
  for (size_t i = 0; i < length; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
  }
  return ss.str();
}

struct DigestContextDeleter {
  void operator()(EVP_MD_CTX *ctx) const {
    EVP_MD_CTX_free(ctx);
  }
};

}  // namespace

std::string generate_document_id() {
  unsigned char bytes[16];
  if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
    throw std::runtime_error("Failed to generate random bytes for a document id");
  }
  return to_hex(bytes, sizeof(bytes));
}

std::string compute_content_hash(const std::string &content) {
  std::unique_ptr<EVP_MD_CTX, DigestContextDeleter> mdctx(EVP_MD_CTX_new());
  if (!mdctx) {
    throw std::runtime_error("Failed to create EVP context for hashing");
  }
  if (EVP_DigestInit_ex(mdctx.get(), EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("Failed to initialize SHA256 digest");
  }
  if (EVP_DigestUpdate(mdctx.get(), content.data(), content.length()) != 1) {
    throw std::runtime_error("Failed to update SHA256 digest");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;
  if (EVP_DigestFinal_ex(mdctx.get(), hash, &hash_len) != 1) {
    throw std::runtime_error("Failed to finalize SHA256 digest");
  }
  return to_hex(hash, hash_len);
}

}  // namespace sage_core
