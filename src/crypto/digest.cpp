#include <provenance/blake3/hash.hpp>
#include <provenance/common/critical.hpp>
#include <provenance/crypto/digest.hpp>

#include <openssl/evp.h>

#include <memory>

namespace provenance::crypto {

namespace {

using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

}  // namespace

provenance::schema::hash32_t sha256(
    const provenance::schema::bytes_view_t& bytes) {
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    provenance::common::critical("failed to allocate SHA-256 context");
  }
  auto out = provenance::schema::hash32_t{};
  auto out_size = static_cast<unsigned int>(out.size());
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
      EVP_DigestUpdate(ctx.get(), bytes.data(), bytes.size()) != 1 ||
      EVP_DigestFinal_ex(ctx.get(), out.data(), &out_size) != 1) {
    provenance::common::critical("SHA-256 digest failed");
  }
  return out;
}

provenance::schema::hash32_t content_hash(
    const provenance::schema::content_hash_algorithm algorithm,
    const provenance::schema::bytes_view_t& bytes) {
  switch (algorithm) {
    case provenance::schema::content_hash_algorithm::sha256:
      return sha256(bytes);
    case provenance::schema::content_hash_algorithm::blake3:
      return provenance::blake3::hash(bytes);
  }
  provenance::common::critical("unknown content hash algorithm");
}

}  // namespace provenance::crypto
