#include "internal/assembly/chain_assembler.hpp"

#include <algorithm>
#include <cstdint>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/redirect/redirect_collapser.hpp"

namespace chains::assembly {

using model::RequestRecord;

namespace {

enum class Reach {
  kUnknown,
  kConnected,
  kBroken,
};

class Walk {
 public:
  Walk(const registry::RequestRegistry& registry, const classifier::CriticalityClassifier& classifier,
       const redirect::RedirectCollapser& collapser)
      : registry_(registry), classifier_(classifier), collapser_(collapser) {
  }

  // Parent in the tree, before any criticality filtering.
  const RequestRecord* ParentOf(const RequestRecord& record) const {
    if (const auto* source = registry_.RedirectSourceOf(record)) {
      return source;
    }

    const auto* initiator = registry_.InitiatorOf(record);
    if (!initiator) {
      return nullptr;
    }

    const auto* chain = collapser_.ChainOf(initiator->id);
    return chain ? &chain->Terminal() : initiator;
  }

  bool IsCritical(const RequestRecord& record) {
    auto [it, inserted] = critical_.emplace(&record, false);
    if (inserted) {
      it->second = classifier_.IsCritical(record);
    }
    return it->second;
  }

  // True when the record and all of its ancestors up to the root are critical.
  bool Connected(const RequestRecord& record) {
    std::vector<const RequestRecord*> path;
    std::unordered_set<const RequestRecord*> on_path;

    Reach result = Reach::kBroken;
    for (const auto* current = &record; current; current = ParentOf(*current)) {
      if (auto known = reach_.find(current); known != reach_.end()) {
        result = known->second;
        break;
      }
      if (!on_path.insert(current).second) {
        // Initiators that loop back never reach the root.
        result = Reach::kBroken;
        break;
      }
      if (!IsCritical(*current)) {
        result = Reach::kBroken;
        path.push_back(current);
        break;
      }
      path.push_back(current);
      if (registry_.IsRoot(*current)) {
        result = Reach::kConnected;
        break;
      }
    }

    for (const auto* visited : path) {
      reach_[visited] = result;
    }
    return result == Reach::kConnected;
  }

 private:
  const registry::RequestRegistry&          registry_;
  const classifier::CriticalityClassifier& classifier_;
  const redirect::RedirectCollapser&        collapser_;

  std::unordered_map<const RequestRecord*, bool>  critical_;
  std::unordered_map<const RequestRecord*, Reach> reach_;
};

} // namespace

ChainAssembler::ChainAssembler(classifier::ClassifierOptions options) : options_(std::move(options)) {
}

Forest ChainAssembler::Assemble(std::shared_ptr<const registry::RequestRegistry> registry) const {
  Forest forest(registry);
  if (!registry || registry->Empty()) {
    return forest;
  }

  classifier::CriticalityClassifier classifier(*registry, options_);
  redirect::RedirectCollapser       collapser(*registry);
  Walk                              walk(*registry, classifier, collapser);

  std::vector<const RequestRecord*> ordered;
  ordered.reserve(registry->Size());
  for (const auto& record : registry->Records()) {
    ordered.push_back(&record);
  }
  std::sort(ordered.begin(), ordered.end(), [](const RequestRecord* a, const RequestRecord* b) {
    if (a->start_time != b->start_time) {
      return a->start_time < b->start_time;
    }
    return a->id < b->id;
  });

  const auto* root = registry->Root();
  forest.AddRoot(forest.GetOrCreate(*root));

  std::size_t critical = 0;
  std::size_t pruned   = 0;
  for (const auto* record : ordered) {
    if (record == root) {
      continue;
    }
    if (!walk.IsCritical(*record)) {
      continue;
    }
    ++critical;

    if (!walk.Connected(*record)) {
      ++pruned;
      continue;
    }

    auto& parent = forest.GetOrCreate(*walk.ParentOf(*record));
    parent.AddChild(forest.GetOrCreate(*record));
  }

  CHAINS_LOG_DEBUG("critical chains assembled",
                   {observability::IntField("records", static_cast<std::int64_t>(registry->Size())),
                    observability::IntField("redirect_chains", static_cast<std::int64_t>(collapser.Chains().size())),
                    observability::IntField("critical", static_cast<std::int64_t>(critical)),
                    observability::IntField("disconnected", static_cast<std::int64_t>(pruned)),
                    observability::IntField("nodes", static_cast<std::int64_t>(forest.Size()))});

  return forest;
}

} // namespace chains::assembly
