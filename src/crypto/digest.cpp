#include <clearhouse/common/critical.hpp>
#include <clearhouse/crypto/digest.hpp>

#include <boost/endian/conversion.hpp>
#include <openssl/evp.h>

#include <iterator>
#include <memory>

namespace clearhouse::crypto {

namespace {

using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

evp_md_ctx_ptr make_sha256_context() {
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    clearhouse::common::critical("failed to initialize SHA-256 context");
  }
  return ctx;
}

void update(EVP_MD_CTX* ctx, const void* data, const std::size_t size) {
  if (EVP_DigestUpdate(ctx, data, size) != 1) {
    clearhouse::common::critical("failed to update SHA-256 digest");
  }
}

clearhouse::schema::hash32_t finalize(EVP_MD_CTX* ctx) {
  auto output = clearhouse::schema::hash32_t{};
  auto length = 0u;
  if (EVP_DigestFinal_ex(ctx, output.data(), &length) != 1 ||
      length != output.size()) {
    clearhouse::common::critical("failed to finalize SHA-256 digest");
  }
  return output;
}

}  // namespace

clearhouse::schema::hash32_t sha256(
    const clearhouse::schema::bytes_view_t& bytes) {
  auto ctx = make_sha256_context();
  update(ctx.get(), bytes.data(), bytes.size());
  return finalize(ctx.get());
}

clearhouse::schema::hash32_t sha256(const std::string_view& str) {
  auto ctx = make_sha256_context();
  update(ctx.get(), str.data(), str.size());
  return finalize(ctx.get());
}

clearhouse::schema::hash32_t sha256_parts(
    const std::span<const std::string_view> parts) {
  auto ctx = make_sha256_context();
  for (const auto& part : parts) {
    auto length =
        boost::endian::native_to_little(static_cast<uint64_t>(part.size()));
    update(ctx.get(), &length, sizeof(length));
    update(ctx.get(), part.data(), part.size());
  }
  return finalize(ctx.get());
}

clearhouse::schema::hash32_t sha256_parts(
    const std::initializer_list<std::string_view> parts) {
  return sha256_parts(
      std::span<const std::string_view>{std::begin(parts), std::end(parts)});
}

std::string fingerprint(const std::string_view& idempotency_key) {
  auto digest = sha256(idempotency_key);
  return "dedup:" + clearhouse::schema::to_hex(clearhouse::schema::bytes_view_t{
                        digest.data(), digest.size()});
}

}  // namespace clearhouse::crypto
