#pragma once

#include <string>
#include <string_view>

namespace chains::util {

/*
  Minimal URL helpers for request classification.

  Only splits what the classifier needs; no normalization or decoding.
*/

// Lowercased scheme without the trailing ':', empty when absent.
std::string Scheme(std::string_view url);

// Last path segment with query and fragment stripped ("" for "/").
std::string LastPathComponent(std::string_view url);

// data:, blob:, about: and similar URLs that never hit the network.
bool IsNonNetworkUrl(std::string_view url);

bool StartsWith(std::string_view value, std::string_view prefix);

std::string ToLower(std::string_view value);

} // namespace chains::util
