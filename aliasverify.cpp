#include "Alias.hpp"
#include "secret.hpp"

#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>

#include <gflags/gflags.h>

#include <glog/logging.h>

DEFINE_int32(hash_length, 8, "hex digits of HMAC expected in each alias");

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
  gflags::SetUsageMessage("aliasverify [flags] alias...");
  google::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);

  if (argc < 2) {
    gflags::ShowUsageWithFlags(argv[0]);
    return 1;
  }

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

  auto const hash_length = static_cast<std::size_t>(FLAGS_hash_length);

  auto all_valid = true;
  for (auto arg = 1; arg < argc; ++arg) {
    auto const valid = Alias::validate(key, argv[arg], hash_length);
    std::cout << argv[arg] << ": " << (valid ? "valid" : "invalid") << '\n';
    all_valid = all_valid && valid;
  }

  return all_valid ? 0 : 1;
}
