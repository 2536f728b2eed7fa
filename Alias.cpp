#include "Alias.hpp"

#include <algorithm>
#include <stdexcept>

#include <openssl/crypto.h>

#include <boost/algorithm/string/join.hpp>

#include <cppcodec/hex_lower.hpp>

#include <glog/logging.h>

#include <fmt/format.h>

constexpr char sep_char = '-';
constexpr char at_char  = '@';

constexpr std::string_view hex_digits = "0123456789abcdef";

static bool is_lower_hex(std::string_view s)
{
  return s.find_first_not_of(hex_digits) == std::string_view::npos;
}

bool Alias::valid_hash_length(std::size_t hash_length)
{
  return (hash_length > 0) && (hash_length <= max_hash_length);
}

std::string Alias::digest(KeyedHash const& hasher,
                          std::string_view secret,
                          std::string_view prefix,
                          std::size_t      hash_length)
{
  auto const mac = hasher.sign(secret, prefix);
  auto       hex = cppcodec::hex_lower::encode(mac);
  if (hex.length() < hash_length) {
    throw std::invalid_argument(
        fmt::format("hash length {} exceeds the {} hex digits available",
                    hash_length, hex.length()));
  }
  hex.resize(hash_length);
  return hex;
}

std::string Alias::generate(KeyedHash const&                hasher,
                            std::string_view                secret,
                            std::vector<std::string> const& parts,
                            std::string_view                domain,
                            std::size_t                     hash_length)
{
  if (parts.empty()) {
    throw std::invalid_argument("aliasParts array cannot be empty");
  }
  if (std::any_of(begin(parts), end(parts),
                  [](auto const& part) { return part.empty(); })) {
    throw std::invalid_argument("alias part cannot be empty");
  }
  // An '@' anywhere but between local part and domain could never be
  // parsed back.
  if (std::any_of(begin(parts), end(parts), [](auto const& part) {
        return part.find(at_char) != std::string::npos;
      })) {
    throw std::invalid_argument("alias part cannot contain '@'");
  }
  if (domain.empty()) {
    throw std::invalid_argument("domain cannot be empty");
  }
  if (domain.find(at_char) != std::string_view::npos) {
    throw std::invalid_argument("domain cannot contain '@'");
  }
  if (!valid_hash_length(hash_length)) {
    throw std::invalid_argument(fmt::format(
        "hash length must be between 1 and {}", max_hash_length));
  }

  // The canonical message is exactly the prefix, the domain is not hashed.
  auto const prefix = boost::algorithm::join(parts, std::string(1, sep_char));

  return fmt::format("{}{}{}{}{}", prefix, sep_char,
                     digest(hasher, secret, prefix, hash_length), at_char,
                     domain);
}

std::string Alias::generate(std::string_view                secret,
                            std::vector<std::string> const& parts,
                            std::string_view                domain,
                            std::size_t                     hash_length)
{
  return generate(KeyedHash::resolve(), secret, parts, domain, hash_length);
}

std::optional<Alias::parse_results> Alias::parse(std::string_view alias,
                                                 std::size_t hash_length)
{
  // {prefix}-{digest}@{domain}
  //         ^last sep ^only at
  // and prefix may itself contain any number of '-' chars

  auto const at_sign = alias.find(at_char);
  if (at_sign == std::string_view::npos ||
      alias.find(at_char, at_sign + 1) != std::string_view::npos) {
    return {};
  }

  auto const local  = alias.substr(0, at_sign);
  auto const domain = alias.substr(at_sign + 1);
  if (local.empty() || domain.empty()) {
    return {};
  }

  auto const last_sep = local.find_last_of(sep_char);
  if (last_sep == std::string_view::npos || last_sep == 0) {
    return {};
  }

  parse_results res;
  res.prefix = local.substr(0, last_sep);
  res.digest = local.substr(last_sep + 1);
  res.domain = domain;

  if (res.digest.length() != hash_length || !is_lower_hex(res.digest)) {
    return {};
  }

  return res;
}

bool Alias::validate(KeyedHash const& hasher,
                     std::string_view secret,
                     std::string_view alias,
                     std::size_t      hash_length)
{
  if (!valid_hash_length(hash_length)) {
    LOG(WARNING) << "hash length " << hash_length << " out of range";
    return false;
  }

  auto const res = parse(alias, hash_length);
  if (!res) {
    LOG(WARNING) << "unrecognized alias format " << alias;
    return false;
  }

  std::string expected;
  try {
    expected = digest(hasher, secret, res->prefix, hash_length);
  }
  catch (std::exception const& e) {
    LOG(WARNING) << "can't compute digest for " << alias << ": " << e.what();
    return false;
  }

  // Both are hash_length bytes, parse() checked the candidate.
  if (CRYPTO_memcmp(expected.data(), res->digest.data(), hash_length) != 0) {
    LOG(WARNING) << "hash mismatch in alias " << alias;
    return false;
  }

  return true;
}

bool Alias::validate(std::string_view secret,
                     std::string_view alias,
                     std::size_t      hash_length)
{
  try {
    return validate(KeyedHash::resolve(), secret, alias, hash_length);
  }
  catch (primitive_unavailable const& e) {
    LOG(WARNING) << e.what();
    return false;
  }
}

bool Alias::validate(std::string_view secret,
                     char const*      alias,
                     std::size_t      hash_length)
{
  if (alias == nullptr) {
    LOG(WARNING) << "null alias";
    return false;
  }
  return validate(secret, std::string_view(alias), hash_length);
}
