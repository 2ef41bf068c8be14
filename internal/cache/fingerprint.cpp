#include "fingerprint.hpp"

#include <openssl/evp.h>

#include <array>
#include <cstdint>
#include <memory>
#include <stdexcept>

namespace chunkscribe::cache {

namespace {

struct DigestContextDeleter {
  void operator()(EVP_MD_CTX* ctx) const {
    EVP_MD_CTX_free(ctx);
  }
};

using DigestContext = std::unique_ptr<EVP_MD_CTX, DigestContextDeleter>;

void Update(EVP_MD_CTX* ctx, const void* data, size_t size) {
  if (EVP_DigestUpdate(ctx, data, size) != 1) {
    throw std::runtime_error("EVP_DigestUpdate failed");
  }
}

void UpdateField(EVP_MD_CTX* ctx, const std::string& field) {
  std::array<uint8_t, 8> length{};
  uint64_t               n = field.size();
  for (int i = 7; i >= 0; --i) {
    length[i] = static_cast<uint8_t>(n & 0xff);
    n >>= 8;
  }
  Update(ctx, length.data(), length.size());
  Update(ctx, field.data(), field.size());
}

} // namespace

std::string Fingerprint(const std::string& kind, const CacheInputs& inputs) {
  DigestContext ctx(EVP_MD_CTX_new());
  if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("failed to initialise SHA-256");
  }

  UpdateField(ctx.get(), kind);
  for (const auto& [name, value] : inputs) {
    UpdateField(ctx.get(), name);
    UpdateField(ctx.get(), value);
  }

  std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
  unsigned int                               digest_len = 0;
  if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &digest_len) != 1) {
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }

  static constexpr char kHex[] = "0123456789abcdef";
  std::string           out;
  out.reserve(digest_len * 2);
  for (unsigned int i = 0; i < digest_len; ++i) {
    out.push_back(kHex[digest[i] >> 4]);
    out.push_back(kHex[digest[i] & 0x0f]);
  }
  return out;
}

} // namespace chunkscribe::cache
