#include "Alias.hpp"
#include "secret.hpp"

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <gflags/gflags.h>

#include <glog/logging.h>

using namespace std::string_literals;

DEFINE_string(domain, "", "domain placed after the '@'");
DEFINE_int32(hash_length, 8, "hex digits of HMAC kept in each alias");

bool validate_hash_length(char const* flagname, int32_t value)
{
  if (value < 1 ||
      !Alias::valid_hash_length(static_cast<std::size_t>(value))) {
    LOG(ERROR) << "hash length must be between 1 and "
               << Alias::max_hash_length;
    return false;
  }
  return true;
}

DEFINE_validator(hash_length, &validate_hash_length);

int main(int argc, char* argv[])
{
  gflags::SetUsageMessage("aliasgen [flags] part...");
  google::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);

  if (argc < 2) {
    gflags::ShowUsageWithFlags(argv[0]);
    return 1;
  }

  auto const domain = [] {
    if (!FLAGS_domain.empty())
      return FLAGS_domain;

    auto const domain_ev{getenv("EMALIAS_DOMAIN")};
    if (domain_ev)
      return std::string{domain_ev};

    LOG(FATAL) << "no domain, use --domain or set EMALIAS_DOMAIN";
    return "(none)"s;
  }();

  auto const key = [] {
    try {
      if (auto const k = secret::load())
        return *k;
    }
    catch (std::runtime_error const& e) {
      LOG(FATAL) << e.what();
    }
    LOG(FATAL) << "no secret, use --secret, --secret_file or EMALIAS_SECRET";
    return std::string{};
  }();

  std::vector<std::string> parts(argv + 1, argv + argc);

  try {
    std::cout << Alias::generate(key, parts, domain,
                                 static_cast<std::size_t>(FLAGS_hash_length))
              << '\n';
  }
  catch (std::invalid_argument const& e) {
    std::cerr << e.what() << '\n';
    return 1;
  }
}
