#ifndef SECRET_DOT_HPP_INCLUDED
#define SECRET_DOT_HPP_INCLUDED

#include <optional>
#include <string>
#include <string_view>

// Where the tools find the HMAC key, first match wins:
//   --secret, --secret_file, $EMALIAS_SECRET

namespace secret {
std::optional<std::string> load();
std::string                from_file(std::string const& path);
std::string_view           trim(std::string_view str);
} // namespace secret

#endif // SECRET_DOT_HPP_INCLUDED
