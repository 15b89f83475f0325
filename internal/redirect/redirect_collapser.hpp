#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/model/request_record.hpp"
#include "internal/registry/request_registry.hpp"

namespace chains::redirect {

/*
  One logical fetch: its wire-level hops, head first.

  A request that never redirected is a chain of one hop. The head id is
  where the chain attaches to its parent; dependents of any hop hang
  under the terminal hop.
*/
struct RedirectChain {
  std::vector<const model::RequestRecord*> hops;

  const model::RequestRecord& Head() const {
    return *hops.front();
  }

  const model::RequestRecord& Terminal() const {
    return *hops.back();
  }

  bool Redirected() const {
    return hops.size() > 1;
  }
};

class RedirectCollapser {
 public:
  explicit RedirectCollapser(const registry::RequestRegistry& registry);

  // Ordered by the head's start time, then id.
  const std::vector<RedirectChain>& Chains() const {
    return chains_;
  }

  // The chain containing the request, nullptr for ids not in the registry.
  const RedirectChain* ChainOf(const std::string& request_id) const;

  // Position of the request within its chain, 0 for heads.
  std::size_t HopIndex(const std::string& request_id) const;

 private:
  std::vector<RedirectChain> chains_;

  struct Position {
    std::size_t chain = 0;
    std::size_t hop   = 0;
  };
  std::unordered_map<std::string, Position> positions_;
};

} // namespace chains::redirect
