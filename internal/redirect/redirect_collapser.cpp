#include "internal/redirect/redirect_collapser.hpp"

#include <algorithm>
#include <utility>

#include "internal/util/errors.hpp"

namespace chains::redirect {

using model::RequestRecord;

RedirectCollapser::RedirectCollapser(const registry::RequestRegistry& registry) {
  std::vector<const RequestRecord*> heads;
  for (const auto& record : registry.Records()) {
    if (!registry.RedirectSourceOf(record)) {
      heads.push_back(&record);
    }
  }

  std::sort(heads.begin(), heads.end(), [](const RequestRecord* a, const RequestRecord* b) {
    if (a->start_time != b->start_time) {
      return a->start_time < b->start_time;
    }
    return a->id < b->id;
  });

  chains_.reserve(heads.size());
  for (const auto* head : heads) {
    RedirectChain chain;
    for (const auto* hop = head; hop; hop = registry.RedirectTargetOf(*hop)) {
      if (positions_.count(hop->id)) {
        throw util::PreconditionViolation("redirect cycle through request " + hop->id);
      }
      positions_[hop->id] = Position{chains_.size(), chain.hops.size()};
      chain.hops.push_back(hop);
    }
    chains_.push_back(std::move(chain));
  }

  // Hops never reached from a head sit on a cycle with no way in.
  if (positions_.size() != registry.Size()) {
    for (const auto& record : registry.Records()) {
      if (!positions_.count(record.id)) {
        throw util::PreconditionViolation("redirect cycle through request " + record.id);
      }
    }
  }
}

const RedirectChain* RedirectCollapser::ChainOf(const std::string& request_id) const {
  auto it = positions_.find(request_id);
  if (it == positions_.end()) {
    return nullptr;
  }
  return &chains_[it->second.chain];
}

std::size_t RedirectCollapser::HopIndex(const std::string& request_id) const {
  auto it = positions_.find(request_id);
  if (it == positions_.end()) {
    throw util::NotFound("request not in any redirect chain: " + request_id);
  }
  return it->second.hop;
}

} // namespace chains::redirect
