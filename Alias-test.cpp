#include "Alias.hpp"

#include <regex>
#include <stdexcept>
#include <string>
#include <vector>

#include <gflags/gflags.h>

#include <glog/logging.h>

#include <fmt/format.h>

using namespace std::string_literals;

constexpr char secret[] = "a-very-secret-key-that-is-long-enough";
constexpr char domain[] = "example.com";

// A provider that was never there.
class missing_hash : public KeyedHash {
public:
  std::string sign(std::string_view, std::string_view) const override
  {
    throw primitive_unavailable("no HMAC in this test");
  }
};

static std::string digest_of(std::string const& alias)
{
  auto const local = alias.substr(0, alias.find('@'));
  return local.substr(local.find_last_of('-') + 1);
}

static bool throws_invalid(std::vector<std::string> const& parts,
                           std::size_t                     hash_length,
                           std::string_view                dom = domain)
{
  try {
    Alias::generate(secret, parts, dom, hash_length);
  }
  catch (std::invalid_argument const& e) {
    LOG(INFO) << "rejected: " << e.what();
    return true;
  }
  return false;
}

int main(int argc, char* argv[])
{
  google::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);

  // Known vectors, these must never change.
  CHECK_EQ(Alias::generate(secret, {"news", "service"}, domain),
           "news-service-a7bd1dad@example.com");
  CHECK_EQ(Alias::generate("k", {"news", "service"}, domain),
           "news-service-bbf86e3e@example.com");
  CHECK_EQ(Alias::generate("my-secret-key", {"shop", "amazon"}, domain, 8),
           "shop-amazon-5899c025@example.com");
  CHECK_EQ(Alias::generate("another-secret", {"news", "tech"}, "test.com", 12),
           "news-tech-bba55fa2eb7f@test.com");
  CHECK_EQ(Alias::generate("Not a real secret, of course.", {"♥", "café"},
                           domain, 16),
           "♥-café-e05406ddbf500d80@example.com");

  auto const example = Alias::generate("k", {"news", "service"}, domain);
  CHECK(std::regex_match(example,
                         std::regex("^news-service-[a-f0-9]{8}@example\\.com$")));
  CHECK(Alias::validate("k", example));
  CHECK(!Alias::validate("k", "news-service-ffffffff@example.com"));

  // Determinism
  CHECK_EQ(Alias::generate(secret, {"shop", "amazon"}, domain),
           Alias::generate(secret, {"shop", "amazon"}, domain));

  // Order and content of the parts matter.
  CHECK_NE(Alias::generate(secret, {"shop", "amazon"}, domain),
           Alias::generate(secret, {"amazon", "shop"}, domain));
  CHECK_NE(Alias::generate(secret, {"type1", "service1"}, domain),
           Alias::generate(secret, {"type2", "service2"}, domain));

  // Different keys, different digests.
  CHECK_NE(Alias::generate("secret-one", {"news"}, domain),
           Alias::generate("secret-two", {"news"}, domain));

  // The domain is not hashed, only appended.
  CHECK_EQ(digest_of(Alias::generate(secret, {"news"}, "a.example")),
           digest_of(Alias::generate(secret, {"news"}, "b.example")));

  // Length contract and round trip for every legal length.
  for (std::size_t n = 1; n <= Alias::max_hash_length; ++n) {
    auto const alias = Alias::generate(secret, {"social", "twitter"}, domain, n);
    auto const dig   = digest_of(alias);
    CHECK_EQ(dig.length(), n) << alias;
    CHECK_EQ(dig.find_first_not_of("0123456789abcdef"), std::string::npos)
        << alias;
    CHECK(Alias::validate(secret, alias, n)) << alias;
    // Shorter digests are prefixes of longer ones.
    CHECK_EQ(digest_of(Alias::generate(secret, {"social", "twitter"}, domain,
                                       Alias::max_hash_length))
                 .substr(0, n),
             dig);
  }

  // Tamper sensitivity: flip every digest character in turn.
  auto const good = Alias::generate(secret, {"finance", "chase-bank"}, domain);
  CHECK(Alias::validate(secret, good));
  auto const dig_pos = good.find('@') - Alias::default_hash_length;
  for (auto i = dig_pos; i < good.find('@'); ++i) {
    auto bad = good;
    bad[i]   = (bad[i] == '0') ? '1' : '0';
    CHECK(!Alias::validate(secret, bad)) << bad;
  }
  CHECK(!Alias::validate(secret, "finance-chase-bank-ffffffff@example.com"));

  // Same digest under a different prefix.
  auto const orig = Alias::generate(secret, {"original", "service"}, domain);
  CHECK(!Alias::validate(
      secret, fmt::format("tampered-service-{}@example.com", digest_of(orig))));

  // Wrong key
  auto const work = Alias::generate(secret, {"work", "github"}, domain);
  CHECK(!Alias::validate("a-different-and-wrong-secret-key", work));

  // Hash length mismatch, both directions.
  auto const ten = Alias::generate(secret, {"test", "length-mismatch"}, domain, 10);
  CHECK(Alias::validate(secret, ten, 10));
  CHECK(!Alias::validate(secret, ten));
  auto const eight = Alias::generate(secret, {"test", "length"}, domain);
  CHECK(!Alias::validate(secret, eight, 10));

  // Parts containing the separator still validate, the whole prefix is
  // what gets hashed.
  auto const dashed = Alias::generate(secret, {"a-b", "c"}, domain);
  CHECK_EQ(dashed, Alias::generate(secret, {"a", "b-c"}, domain));
  CHECK(Alias::validate(secret, dashed));

  // Unicode, punctuation and long parts pass through untouched.
  for (auto const& parts : std::vector<std::vector<std::string>>{
           {"test.service", "provider+tag", "under_score"},
           {"测试", "сервис", "🔑"},
           {std::string(200, 'a'), std::string(200, 'b')},
       }) {
    auto const alias = Alias::generate(secret, parts, domain, 12);
    CHECK(Alias::validate(secret, alias, 12)) << alias;
  }

  // Malformed input is false, never an exception.
  for (auto const& bad : {
           "test-service@example.com"s, // no digest
           "test-service-12345678"s,    // no @domain
           "plainstring"s,
           ""s,
           "12345678@example.com"s,           // no prefix
           "-12345678@example.com"s,          // empty prefix
           "news-service-a7bd1dad@"s,         // empty domain
           "@example.com"s,                   // empty local part
           "news-service-a7bd1dad@x@y.com"s,  // two @
           "news-service-A7BD1DAD@example.com"s, // uppercase hex
           "news-service-a7bd1daz@example.com"s, // not hex
           "news-service-a7bd1d@example.com"s,   // short digest
       }) {
    CHECK(!Alias::validate(secret, bad)) << bad;
  }
  CHECK(!Alias::validate(secret, static_cast<char const*>(nullptr)));

  // Out of range lengths are false for validate, an error for generate.
  CHECK(!Alias::validate(secret, example, 0));
  CHECK(!Alias::validate(secret, example, Alias::max_hash_length + 1));
  CHECK(throws_invalid({"news"}, 0));
  CHECK(throws_invalid({"news"}, Alias::max_hash_length + 1));

  // Empty parts
  CHECK(throws_invalid({}, Alias::default_hash_length));
  CHECK(throws_invalid({"news", ""}, Alias::default_hash_length));

  // Anything generate() hands out must parse back, so an '@' that would
  // move the split, or an empty domain, is refused up front.
  CHECK(throws_invalid({"news"}, Alias::default_hash_length, ""));
  CHECK(throws_invalid({"news"}, Alias::default_hash_length, "a@b.com"));
  CHECK(throws_invalid({"a@b", "shop"}, Alias::default_hash_length));
  CHECK(throws_invalid({"shop", "@"}, Alias::default_hash_length));
  CHECK(!throws_invalid({"news"}, Alias::default_hash_length, "b.com"));
  CHECK(Alias::validate(secret, Alias::generate(secret, {"news"}, "b")));

  CHECK(Alias::valid_hash_length(1));
  CHECK(Alias::valid_hash_length(Alias::max_hash_length));
  CHECK(!Alias::valid_hash_length(0));
  CHECK(!Alias::valid_hash_length(Alias::max_hash_length + 1));

  try {
    Alias::generate(secret, {}, domain);
    LOG(FATAL) << "empty parts accepted";
  }
  catch (std::invalid_argument const& e) {
    CHECK_EQ(e.what(), "aliasParts array cannot be empty"s);
  }

  // parse() structure
  auto const res = Alias::parse("shop-amazon-5899c025@example.com", 8);
  CHECK(res);
  CHECK_EQ(res->prefix, "shop-amazon");
  CHECK_EQ(res->digest, "5899c025");
  CHECK_EQ(res->domain, "example.com");
  CHECK(!Alias::parse("shop-amazon-5899c025@example.com", 9));

  // An unavailable primitive fails generation, and validation is just false.
  missing_hash missing;
  auto threw = false;
  try {
    Alias::generate(missing, secret, {"news"}, domain);
  }
  catch (primitive_unavailable const& e) {
    threw = true;
  }
  CHECK(threw);
  CHECK(!Alias::validate(missing, secret, example));

  // An injected provider is used as given.
  HMAC_SHA256 const hmac;
  CHECK_EQ(Alias::generate(hmac, "k", {"news", "service"}, domain),
           "news-service-bbf86e3e@example.com");
  CHECK(Alias::validate(hmac, "k", "news-service-bbf86e3e@example.com"));
}
