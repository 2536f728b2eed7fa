#include "KeyedHash.hpp"

#include <string>

#include <cppcodec/hex_lower.hpp>

#include <glog/logging.h>

using namespace std::string_literals;

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  HMAC_SHA256 hmac;
  CHECK_EQ(HMAC_SHA256::digest_bytes, 32u);

  auto hex = [&hmac](std::string_view key, std::string_view msg) {
    return cppcodec::hex_lower::encode(hmac.sign(key, msg));
  };

  // RFC 4231 test case 1
  CHECK_EQ(hex(std::string(20, '\x0b'), "Hi There"),
           "b0344c61d8db38535ca8afceaf0bf12b881dc200c9833da726e9376c2e32cff7");

  // RFC 4231 test case 2
  CHECK_EQ(hex("Jefe", "what do ya want for nothing?"),
           "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");

  // RFC 4231 test case 4
  std::string key4;
  for (auto c = 0x01; c <= 0x19; ++c)
    key4 += static_cast<char>(c);
  CHECK_EQ(hex(key4, std::string(50, '\xcd')),
           "82558a389a443c0ea4cc819899f2083a85f0faa3e578f8077a2e3ff46729665b");

  // Same inputs, same bytes, every time.
  auto const first = hmac.sign("test-hmac-key", "test-data-for-hmac-consistency");
  for (auto i = 0; i < 10; ++i) {
    CHECK_EQ(hmac.sign("test-hmac-key", "test-data-for-hmac-consistency"),
             first);
  }
  CHECK_EQ(first.size(), HMAC_SHA256::digest_bytes);

  // One bit of key or message changes the output.
  CHECK_NE(hmac.sign("test-hmac-kez", "test-data-for-hmac-consistency"), first);
  CHECK_NE(hmac.sign("test-hmac-key", "test-data-for-hmac-consistencz"), first);

  // Zero length key and message are legal HMAC inputs.
  CHECK_EQ(hmac.sign("", "").size(), HMAC_SHA256::digest_bytes);
  CHECK_NE(hmac.sign("", "x"), hmac.sign("", ""));

  // Keys longer than the SHA-256 block are hashed first, still fine.
  CHECK_EQ(hmac.sign(std::string(200, 'k'), "msg").size(),
           HMAC_SHA256::digest_bytes);

  // Embedded NULs are part of the key and message.
  CHECK_NE(hmac.sign("a\0b"s, "m"), hmac.sign("a", "m"));
  CHECK_NE(hmac.sign("k", "m\0"s), hmac.sign("k", "m"));

  // The resolved provider is the same object each time and agrees with ours.
  auto const& resolved = KeyedHash::resolve();
  CHECK_EQ(&resolved, &KeyedHash::resolve());
  CHECK_EQ(resolved.sign("Jefe", "what do ya want for nothing?"),
           hmac.sign("Jefe", "what do ya want for nothing?"));
}
