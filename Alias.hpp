#ifndef ALIAS_DOT_HPP
#define ALIAS_DOT_HPP

#include "KeyedHash.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Self-verifying email aliases: <part>-<part>-...-<digest>@<domain>
//
// The digest is the lowercase hex HMAC of the local prefix (the parts
// joined with '-') under a secret key, truncated to hash_length chars.
// Nothing is stored; an alias is checked by recomputing its digest.

class Alias {
public:
  static constexpr std::size_t default_hash_length = 8;
  static constexpr std::size_t max_hash_length     = 64; // hex of SHA-256

  struct parse_results {
    std::string_view prefix; // parts, still joined with '-'
    std::string_view digest;
    std::string_view domain;
  };

  // Split an alias into prefix, digest and domain. Structural checks only,
  // nothing is hashed.
  static std::optional<parse_results> parse(std::string_view alias,
                                            std::size_t      hash_length);

  static bool valid_hash_length(std::size_t hash_length);

  // Throws std::invalid_argument for empty parts, an empty domain, an '@'
  // in any part or the domain, or a hash_length outside 1..max_hash_length.
  static std::string generate(KeyedHash const&                hasher,
                              std::string_view                secret,
                              std::vector<std::string> const& parts,
                              std::string_view                domain,
                              std::size_t hash_length = default_hash_length);

  static std::string generate(std::string_view                secret,
                              std::vector<std::string> const& parts,
                              std::string_view                domain,
                              std::size_t hash_length = default_hash_length);

  // Never throws; anything malformed, forged or signed with another key or
  // length is simply false.
  static bool validate(KeyedHash const& hasher,
                       std::string_view secret,
                       std::string_view alias,
                       std::size_t      hash_length = default_hash_length);

  static bool validate(std::string_view secret,
                       std::string_view alias,
                       std::size_t      hash_length = default_hash_length);

  // For aliases coming straight from C strings, nullptr is not an alias.
  static bool validate(std::string_view secret,
                       char const*      alias,
                       std::size_t      hash_length = default_hash_length);

  static std::string digest(KeyedHash const& hasher,
                            std::string_view secret,
                            std::string_view prefix,
                            std::size_t      hash_length);
};

#endif // ALIAS_DOT_HPP
