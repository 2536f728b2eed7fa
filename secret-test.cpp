#include "secret.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>

#include <gflags/gflags.h>

#include <glog/logging.h>

DECLARE_string(secret);
DECLARE_string(secret_file);

namespace fs = std::filesystem;

int main(int argc, char* argv[])
{
  google::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);

  CHECK_EQ(secret::trim("key\n"), "key");
  CHECK_EQ(secret::trim("key \t\r\n"), "key");
  CHECK_EQ(secret::trim("  key"), "  key");
  CHECK_EQ(secret::trim("\n\n"), "");
  CHECK_EQ(secret::trim(""), "");

  auto const dir  = fs::temp_directory_path();
  auto const path = dir / "emalias-secret-test.key";
  {
    std::ofstream key_file(path);
    key_file << "file secret\n";
  }

  auto const empty_path = dir / "emalias-secret-test.empty";
  { std::ofstream empty_file(empty_path); }

  CHECK_EQ(secret::from_file(path.string()), "file secret");

  auto threw = false;
  try {
    secret::from_file((dir / "emalias-no-such-file").string());
  }
  catch (std::runtime_error const& e) {
    threw = true;
  }
  CHECK(threw);

  threw = false;
  try {
    secret::from_file(empty_path.string());
  }
  catch (std::runtime_error const& e) {
    threw = true;
  }
  CHECK(threw);

  // Precedence: --secret, --secret_file, $EMALIAS_SECRET

  unsetenv("EMALIAS_SECRET");
  FLAGS_secret.clear();
  FLAGS_secret_file.clear();
  CHECK(!secret::load());

  setenv("EMALIAS_SECRET", "env secret\n", 1);
  CHECK_EQ(*secret::load(), "env secret");

  FLAGS_secret_file = path.string();
  CHECK_EQ(*secret::load(), "file secret");

  FLAGS_secret = "flag secret";
  CHECK_EQ(*secret::load(), "flag secret");

  // A blank environment variable is the same as none.
  FLAGS_secret.clear();
  FLAGS_secret_file.clear();
  setenv("EMALIAS_SECRET", " \n", 1);
  CHECK(!secret::load());

  unsetenv("EMALIAS_SECRET");
  fs::remove(path);
  fs::remove(empty_path);
}
