#include "internal/util/url.hpp"

#include <array>
#include <cctype>

namespace chains::util {

namespace {

constexpr std::array<std::string_view, 7> kNonNetworkSchemes = {
    "data", "blob", "about", "chrome", "chrome-extension", "file", "filesystem",
};

} // namespace

std::string ToLower(std::string_view value) {
  std::string out(value);
  for (auto& c : out) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return out;
}

bool StartsWith(std::string_view value, std::string_view prefix) {
  return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}

std::string Scheme(std::string_view url) {
  const auto colon = url.find(':');
  if (colon == std::string_view::npos || colon == 0) {
    return {};
  }

  // A '/', '?' or '#' before the colon means there is no scheme.
  const auto delimiter = url.find_first_of("/?#");
  if (delimiter != std::string_view::npos && delimiter < colon) {
    return {};
  }

  return ToLower(url.substr(0, colon));
}

std::string LastPathComponent(std::string_view url) {
  std::string_view rest = url;

  const auto scheme_pos = rest.find("://");
  if (scheme_pos != std::string_view::npos) {
    rest = rest.substr(scheme_pos + 3);
    const auto path_pos = rest.find('/');
    if (path_pos == std::string_view::npos) {
      return {};
    }
    rest = rest.substr(path_pos);
  }

  const auto query_pos = rest.find_first_of("?#");
  if (query_pos != std::string_view::npos) {
    rest = rest.substr(0, query_pos);
  }

  const auto slash = rest.rfind('/');
  if (slash != std::string_view::npos) {
    rest = rest.substr(slash + 1);
  }
  return std::string(rest);
}

bool IsNonNetworkUrl(std::string_view url) {
  const auto scheme = Scheme(url);
  if (scheme.empty()) {
    return false;
  }
  for (const auto candidate : kNonNetworkSchemes) {
    if (scheme == candidate) {
      return true;
    }
  }
  return false;
}

} // namespace chains::util
