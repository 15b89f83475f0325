#include "internal/registry/request_registry.hpp"

#include <algorithm>
#include <functional>
#include <utility>

#include "internal/model/proto_convert.hpp"
#include "internal/util/errors.hpp"

namespace chains::registry {

using model::RequestRecord;

namespace {

// Keeps the candidates matching pred, unless none would remain.
template <typename Pred>
void Narrow(std::vector<std::size_t>& candidates, const std::vector<RequestRecord>& records, Pred pred) {
  if (candidates.size() <= 1) {
    return;
  }

  std::vector<std::size_t> kept;
  for (auto index : candidates) {
    if (pred(records[index])) {
      kept.push_back(index);
    }
  }

  if (!kept.empty()) {
    candidates = std::move(kept);
  }
}

bool EarlierThan(const RequestRecord& a, const RequestRecord& b) {
  if (a.start_time != b.start_time) {
    return a.start_time < b.start_time;
  }
  return a.id < b.id;
}

} // namespace

RequestRegistry::RequestRegistry(std::vector<RequestRecord> records, std::string main_document_url)
    : records_(std::move(records)) {
  IndexRecords();
  LinkRedirects();
  ResolveInitiators();
  SelectRoot(main_document_url);
}

std::shared_ptr<const RequestRegistry> RequestRegistry::FromProto(
    const google::protobuf::RepeatedPtrField<chains::analyzer::v1::NetworkRequest>& records,
    const std::string& main_document_url) {
  std::vector<RequestRecord> converted;
  converted.reserve(static_cast<std::size_t>(records.size()));
  for (const auto& record : records) {
    converted.push_back(model::FromProto(record));
  }
  return std::make_shared<const RequestRegistry>(std::move(converted), main_document_url);
}

// ------------------------------------------------------------
// Lookups
// ------------------------------------------------------------

const RequestRecord* RequestRegistry::Find(const std::string& id) const {
  auto it = by_id_.find(id);
  if (it == by_id_.end()) {
    return nullptr;
  }
  return &records_[it->second];
}

const RequestRecord* RequestRegistry::Root() const {
  if (!root_) {
    return nullptr;
  }
  return &records_[*root_];
}

bool RequestRegistry::IsRoot(const RequestRecord& record) const {
  auto index = IndexOf(record);
  return index && root_ && *index == *root_;
}

const RequestRecord* RequestRegistry::InitiatorOf(const RequestRecord& record) const {
  auto index = IndexOf(record);
  if (!index) {
    return nullptr;
  }

  if (auto it = redirect_source_.find(*index); it != redirect_source_.end()) {
    return &records_[it->second];
  }
  if (auto it = initiator_.find(*index); it != initiator_.end()) {
    return &records_[it->second];
  }
  return nullptr;
}

const RequestRecord* RequestRegistry::RedirectSourceOf(const RequestRecord& record) const {
  auto index = IndexOf(record);
  if (!index) {
    return nullptr;
  }

  auto it = redirect_source_.find(*index);
  return it == redirect_source_.end() ? nullptr : &records_[it->second];
}

const RequestRecord* RequestRegistry::RedirectTargetOf(const RequestRecord& record) const {
  auto index = IndexOf(record);
  if (!index) {
    return nullptr;
  }

  auto it = redirect_target_.find(*index);
  return it == redirect_target_.end() ? nullptr : &records_[it->second];
}

ResolvedDestination RequestRegistry::ResolveDestination(const RequestRecord& record) const {
  const RequestRecord* terminal = &record;
  while (const auto* next = RedirectTargetOf(*terminal)) {
    terminal = next;
  }

  ResolvedDestination out;
  out.resource_type = terminal->resource_type;
  out.priority      = terminal->priority;
  out.frame_id      = terminal->frame_id;
  out.url           = terminal->url;
  out.mime_type     = terminal->mime_type;

  // The last recorded hop still redirects: its destination was not captured,
  // only the attributes it declared.
  if (terminal->redirect_destination) {
    const auto& destination = *terminal->redirect_destination;
    if (model::IsDeclared(destination.resource_type)) {
      out.resource_type = destination.resource_type;
    }
    if (model::IsDeclared(destination.priority)) {
      out.priority = destination.priority;
    }
    if (!destination.frame_id.empty()) {
      out.frame_id = destination.frame_id;
    }
    if (!destination.url.empty()) {
      out.url = destination.url;
    }
  }

  return out;
}

std::optional<std::size_t> RequestRegistry::IndexOf(const RequestRecord& record) const {
  // std::less gives a total order even for pointers outside records_.
  const std::less<const RequestRecord*> before;
  if (!records_.empty() && !before(&record, records_.data()) && before(&record, records_.data() + records_.size())) {
    return static_cast<std::size_t>(&record - records_.data());
  }

  auto it = by_id_.find(record.id);
  if (it == by_id_.end()) {
    return std::nullopt;
  }
  return it->second;
}

// ------------------------------------------------------------
// Construction
// ------------------------------------------------------------

void RequestRegistry::IndexRecords() {
  by_id_.reserve(records_.size());

  for (std::size_t i = 0; i < records_.size(); ++i) {
    const auto& record = records_[i];
    if (record.id.empty()) {
      throw util::PreconditionViolation("request record without id");
    }
    if (!by_id_.emplace(record.id, i).second) {
      throw util::PreconditionViolation("duplicate request id: " + record.id);
    }
    by_url_[record.url].push_back(i);
  }
}

void RequestRegistry::LinkRedirects() {
  for (std::size_t i = 0; i < records_.size(); ++i) {
    const auto& record = records_[i];
    if (!record.redirect_destination || record.redirect_destination->request_id.empty()) {
      continue;
    }

    auto target = by_id_.find(record.redirect_destination->request_id);
    if (target == by_id_.end()) {
      // Destination not captured; its declared attributes stand in for it.
      continue;
    }
    if (target->second == i) {
      throw util::PreconditionViolation("request redirects to itself: " + record.id);
    }

    auto [it, inserted] = redirect_source_.emplace(target->second, i);
    if (!inserted) {
      throw util::PreconditionViolation("request " + target->first + " is the redirect destination of both " +
                                        records_[it->second].id + " and " + record.id);
    }
    redirect_target_.emplace(i, target->second);
  }

  // Every hop has at most one successor and one predecessor, so a walk
  // longer than the record count can only be a cycle.
  for (const auto& [start, next] : redirect_target_) {
    std::size_t steps   = 0;
    std::size_t current = next;
    while (true) {
      if (current == start || ++steps > records_.size()) {
        throw util::PreconditionViolation("redirect cycle through request " + records_[start].id);
      }
      auto it = redirect_target_.find(current);
      if (it == redirect_target_.end()) {
        break;
      }
      current = it->second;
    }
  }
}

void RequestRegistry::ResolveInitiators() {
  for (std::size_t i = 0; i < records_.size(); ++i) {
    if (redirect_source_.count(i)) {
      continue;
    }
    if (auto chosen = ChooseInitiator(i)) {
      initiator_.emplace(i, *chosen);
    }
  }
}

std::optional<std::size_t> RequestRegistry::ChooseInitiator(std::size_t index) const {
  const auto& record = records_[index];
  if (!record.initiator || record.initiator->url.empty()) {
    return std::nullopt;
  }

  auto by_url = by_url_.find(record.initiator->url);
  if (by_url == by_url_.end()) {
    return std::nullopt;
  }

  std::vector<std::size_t> candidates;
  for (auto candidate : by_url->second) {
    const auto& other = records_[candidate];
    if (candidate == index || !other.finished) {
      continue;
    }
    if (other.response_received_time > record.start_time) {
      continue;
    }
    candidates.push_back(candidate);
  }

  Narrow(candidates, records_, [](const RequestRecord& c) {
    return c.resource_type != model::ResourceType::kOther;
  });
  Narrow(candidates, records_, [&record](const RequestRecord& c) {
    return c.frame_id == record.frame_id;
  });
  if (record.initiator->kind == model::InitiatorKind::kParser) {
    Narrow(candidates, records_, [](const RequestRecord& c) {
      return c.resource_type == model::ResourceType::kDocument;
    });
  }

  if (candidates.size() != 1) {
    return std::nullopt;
  }
  return candidates.front();
}

std::size_t RequestRegistry::ChainHead(std::size_t index) const {
  auto it = redirect_source_.find(index);
  while (it != redirect_source_.end()) {
    index = it->second;
    it    = redirect_source_.find(index);
  }
  return index;
}

void RequestRegistry::SelectRoot(const std::string& main_document_url) {
  if (records_.empty()) {
    return;
  }

  if (!main_document_url.empty()) {
    auto by_url = by_url_.find(main_document_url);
    if (by_url == by_url_.end()) {
      throw util::PreconditionViolation("main document url matches no request: " + main_document_url);
    }

    auto earliest = *std::min_element(by_url->second.begin(), by_url->second.end(),
                                      [this](std::size_t a, std::size_t b) {
                                        return EarlierThan(records_[a], records_[b]);
                                      });

    auto head = ChainHead(earliest);
    if (records_[head].initiator || initiator_.count(head)) {
      throw util::PreconditionViolation("root document has an initiator: " + records_[head].id);
    }
    root_ = head;
    return;
  }

  std::vector<std::size_t> heads;
  for (std::size_t i = 0; i < records_.size(); ++i) {
    if (redirect_source_.count(i) || records_[i].initiator) {
      continue;
    }
    heads.push_back(i);
  }

  if (heads.empty()) {
    throw util::PreconditionViolation("no request without an initiator to serve as root document");
  }

  auto earliest = *std::min_element(heads.begin(), heads.end(), [this](std::size_t a, std::size_t b) {
    return EarlierThan(records_[a], records_[b]);
  });

  for (auto other : heads) {
    if (other != earliest && records_[other].start_time == records_[earliest].start_time) {
      throw util::PreconditionViolation("ambiguous root document: " + records_[earliest].id + " and " +
                                        records_[other].id + " start together without an initiator");
    }
  }

  root_ = earliest;
}

} // namespace chains::registry
