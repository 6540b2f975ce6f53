#include <hexref/common/critical.hpp>
#include <hexref/crypto/hmac.hpp>

#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/params.h>

#include <array>
#include <memory>

namespace hexref::crypto {

namespace {

using evp_mac_ptr = std::unique_ptr<EVP_MAC, decltype(&EVP_MAC_free)>;
using evp_mac_ctx_ptr =
    std::unique_ptr<EVP_MAC_CTX, decltype(&EVP_MAC_CTX_free)>;

// OpenSSL rejects a null key pointer even when the length is zero.
const uint8_t* key_pointer(const hexref::schema::bytes_view_t& key) {
  static constexpr uint8_t kEmpty = 0;
  return key.empty() ? &kEmpty : key.data();
}

}  // namespace

hexref::schema::hash32_t hmac_sha256(
    const hexref::schema::bytes_view_t& key,
    const hexref::schema::bytes_view_t& message) {
  auto mac = evp_mac_ptr{EVP_MAC_fetch(nullptr, OSSL_MAC_NAME_HMAC, nullptr),
                         EVP_MAC_free};
  if (!mac) {
    hexref::common::critical("OpenSSL HMAC implementation is unavailable");
  }
  auto ctx = evp_mac_ctx_ptr{EVP_MAC_CTX_new(mac.get()), EVP_MAC_CTX_free};
  if (!ctx) {
    hexref::common::critical("failed to allocate HMAC context");
  }

  char digest_name[] = "SHA256";
  auto params = std::array<OSSL_PARAM, 2>{
      OSSL_PARAM_construct_utf8_string(OSSL_MAC_PARAM_DIGEST, digest_name, 0),
      OSSL_PARAM_construct_end()};

  if (EVP_MAC_init(ctx.get(), key_pointer(key), key.size(), params.data()) !=
      1) {
    hexref::common::critical("failed to initialize HMAC-SHA256");
  }
  if (EVP_MAC_update(ctx.get(), message.data(), message.size()) != 1) {
    hexref::common::critical("failed to update HMAC-SHA256");
  }

  auto output = hexref::schema::hash32_t{};
  auto written = std::size_t{};
  if (EVP_MAC_final(ctx.get(), output.data(), &written, output.size()) != 1 ||
      written != output.size()) {
    hexref::common::critical("failed to finalize HMAC-SHA256");
  }
  return output;
}

hexref::schema::hash32_t hmac_sha256(std::string_view key,
                                     std::string_view message) {
  return hmac_sha256(hexref::schema::make_bytes_view(key),
                     hexref::schema::make_bytes_view(message));
}

std::string hmac_sha256_hex(std::string_view key, std::string_view message) {
  auto digest = hmac_sha256(key, message);
  return hexref::schema::to_upper_hex(
      hexref::schema::bytes_view_t{digest.data(), digest.size()});
}

}  // namespace hexref::crypto
