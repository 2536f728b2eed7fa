#include "secret.hpp"

#include <cstdlib>
#include <filesystem>
#include <stdexcept>

#include <boost/iostreams/device/mapped_file.hpp>

#include <gflags/gflags.h>

#include <glog/logging.h>

#include <fmt/format.h>

namespace fs = std::filesystem;

DEFINE_string(secret, "", "HMAC key used to sign and check aliases");
DEFINE_string(secret_file, "", "file holding the HMAC key");

namespace secret {

std::string_view trim(std::string_view str)
{
  auto const last = str.find_last_not_of(" \t\r\n");
  if (last == std::string_view::npos)
    return {};
  return str.substr(0, last + 1);
}

std::string from_file(std::string const& path)
{
  if (!fs::exists(path))
    throw std::runtime_error(fmt::format("can't find secret file {}", path));

  // mapped_file_source refuses to map an empty file
  if (fs::file_size(path) == 0)
    throw std::runtime_error(fmt::format("secret file {} is empty", path));

  boost::iostreams::mapped_file_source file;
  file.open(path);
  auto const key = trim(std::string_view(file.data(), file.size()));
  if (key.empty())
    throw std::runtime_error(fmt::format("secret file {} is blank", path));

  return std::string(key);
}

std::optional<std::string> load()
{
  if (!FLAGS_secret.empty())
    return FLAGS_secret;

  if (!FLAGS_secret_file.empty()) {
    VLOG(1) << "reading secret from " << FLAGS_secret_file;
    return from_file(FLAGS_secret_file);
  }

  auto const secret_ev{getenv("EMALIAS_SECRET")};
  if (secret_ev) {
    auto const key = trim(secret_ev);
    if (!key.empty())
      return std::string(key);
  }

  return {};
}
} // namespace secret
