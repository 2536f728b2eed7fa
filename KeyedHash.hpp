#ifndef KEYEDHASH_DOT_HPP
#define KEYEDHASH_DOT_HPP

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

typedef struct evp_mac_st EVP_MAC;

// The keyed hash capability: one operation, sign(key, message) -> bytes.

class KeyedHash {
public:
  virtual ~KeyedHash() = default;

  // Raw digest bytes, not encoded.
  virtual std::string sign(std::string_view key,
                           std::string_view message) const = 0;

  // The host's HMAC-SHA256, looked up on first use and shared by every
  // caller afterward.
  static KeyedHash const& resolve();
};

class primitive_unavailable : public std::runtime_error {
public:
  explicit primitive_unavailable(std::string const& what)
    : std::runtime_error(what)
  {
  }
};

// HMAC-SHA256 from OpenSSL's EVP_MAC interface.

class HMAC_SHA256 : public KeyedHash {
public:
  HMAC_SHA256(HMAC_SHA256 const&) = delete;
  HMAC_SHA256& operator=(HMAC_SHA256 const&) = delete;

  HMAC_SHA256();
  ~HMAC_SHA256() override;

  std::string sign(std::string_view key,
                   std::string_view message) const override;

  static constexpr std::size_t digest_bytes = 32;

private:
  EVP_MAC* mac_; // immutable once fetched, safe to share between threads
};

#endif // KEYEDHASH_DOT_HPP
