#pragma once

#include <cstddef>
#include <string>

#include "chains/analyzer/v1.hpp"
#include "internal/assembly/forest.hpp"

namespace chains::assembly {

// Longest root-to-leaf path, in requests, that a protobuf reader with the
// default recursion limit (100) can parse back out of ComputeChainsResponse.
// Each level costs a map entry and a ChainNode.
constexpr std::size_t kMaxChainDepth = 48;

// Nested {request, children} rendering of the forest. No filtering.
// Throws util::InvalidArgument when a chain is longer than kMaxChainDepth.
chains::analyzer::v1::CriticalRequestChains Serialize(const Forest& forest);

// Protobuf JSON mapping with the proto field names.
std::string ToJson(const chains::analyzer::v1::CriticalRequestChains& chains, bool pretty = false);

} // namespace chains::assembly
