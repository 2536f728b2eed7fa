#include "KeyedHash.hpp"

#include <memory>

#include <openssl/core_names.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/params.h>

#include <glog/logging.h>

#include <fmt/format.h>

namespace {
void log_ssl_errors()
{
  unsigned long er;
  while (0 != (er = ERR_get_error()))
    LOG(WARNING) << ERR_error_string(er, nullptr);
}

[[noreturn]] void unavailable(char const* what)
{
  log_ssl_errors();
  throw primitive_unavailable(fmt::format("HMAC-SHA256 unavailable: {}", what));
}

struct mac_ctx_deleter {
  void operator()(EVP_MAC_CTX* ctx) const { EVP_MAC_CTX_free(ctx); }
};
using mac_ctx_ptr = std::unique_ptr<EVP_MAC_CTX, mac_ctx_deleter>;

// EVP_MAC_init() treats a null key as "no key given", so a zero length key
// must still point somewhere.
unsigned char const empty_key[1]{};
} // namespace

KeyedHash const& KeyedHash::resolve()
{
  static HMAC_SHA256 const hmac;
  return hmac;
}

HMAC_SHA256::HMAC_SHA256()
  : mac_(EVP_MAC_fetch(nullptr, OSSL_MAC_NAME_HMAC, nullptr))
{
  if (mac_ == nullptr)
    unavailable("EVP_MAC_fetch failed");
}

HMAC_SHA256::~HMAC_SHA256() { EVP_MAC_free(mac_); }

std::string HMAC_SHA256::sign(std::string_view key,
                              std::string_view message) const
{
  mac_ctx_ptr ctx{EVP_MAC_CTX_new(mac_)};
  if (!ctx)
    unavailable("EVP_MAC_CTX_new failed");

  char digest[] = "SHA256";
  OSSL_PARAM params[] = {
      OSSL_PARAM_construct_utf8_string(OSSL_MAC_PARAM_DIGEST, digest, 0),
      OSSL_PARAM_construct_end(),
  };

  auto const key_data =
      key.empty() ? empty_key
                  : reinterpret_cast<unsigned char const*>(key.data());

  if (EVP_MAC_init(ctx.get(), key_data, key.size(), params) != 1)
    unavailable("EVP_MAC_init failed");

  if (EVP_MAC_update(ctx.get(),
                     reinterpret_cast<unsigned char const*>(message.data()),
                     message.size()) != 1)
    unavailable("EVP_MAC_update failed");

  unsigned char md[EVP_MAX_MD_SIZE];
  size_t        md_len = 0;
  if (EVP_MAC_final(ctx.get(), md, &md_len, sizeof(md)) != 1)
    unavailable("EVP_MAC_final failed");

  CHECK_EQ(md_len, digest_bytes);

  return std::string(reinterpret_cast<char const*>(md), md_len);
}
