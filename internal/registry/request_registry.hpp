#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <google/protobuf/repeated_field.h>

#include "chains/analyzer/v1.hpp"
#include "internal/model/request_record.hpp"

namespace chains::registry {

/*
  Attributes of the resource a redirect chain finally delivers.

  For a record that is not redirected this is the record itself.
*/
struct ResolvedDestination {
  model::ResourceType resource_type = model::ResourceType::kUnspecified;
  model::Priority priority = model::Priority::kUnspecified;
  std::string frame_id;
  std::string url;
  std::string mime_type;
};

/*
  Addressable view over one flat list of request records.

  Built once per computation; the records never move afterwards, so
  pointers handed out stay valid for the registry's lifetime. Arrival
  order of the input is irrelevant to every lookup.

  Throws util::PreconditionViolation for duplicate ids, redirect cycles,
  a record redirected into from two sources, and an invalid or ambiguous
  root document.
*/
class RequestRegistry {
 public:
  explicit RequestRegistry(std::vector<model::RequestRecord> records, std::string main_document_url = {});

  static std::shared_ptr<const RequestRegistry> FromProto(
      const google::protobuf::RepeatedPtrField<chains::analyzer::v1::NetworkRequest>& records,
      const std::string& main_document_url = {});

  RequestRegistry(const RequestRegistry&) = delete;
  RequestRegistry& operator=(const RequestRegistry&) = delete;

  bool Empty() const {
    return records_.empty();
  }

  std::size_t Size() const {
    return records_.size();
  }

  const std::vector<model::RequestRecord>& Records() const {
    return records_;
  }

  const model::RequestRecord* Find(const std::string& id) const;

  // nullptr only when the registry is empty.
  const model::RequestRecord* Root() const;
  bool IsRoot(const model::RequestRecord& record) const;

  // The record that triggered this one: its redirect source when it is a
  // redirect destination, otherwise the request its initiator resolves to.
  const model::RequestRecord* InitiatorOf(const model::RequestRecord& record) const;

  const model::RequestRecord* RedirectSourceOf(const model::RequestRecord& record) const;
  const model::RequestRecord* RedirectTargetOf(const model::RequestRecord& record) const;

  ResolvedDestination ResolveDestination(const model::RequestRecord& record) const;

 private:
  std::optional<std::size_t> IndexOf(const model::RequestRecord& record) const;

  void IndexRecords();
  void LinkRedirects();
  void ResolveInitiators();
  void SelectRoot(const std::string& main_document_url);

  std::optional<std::size_t> ChooseInitiator(std::size_t index) const;
  std::size_t ChainHead(std::size_t index) const;

  std::vector<model::RequestRecord> records_;

  std::unordered_map<std::string, std::size_t>              by_id_;
  std::unordered_map<std::string, std::vector<std::size_t>> by_url_;

  std::unordered_map<std::size_t, std::size_t> redirect_source_;
  std::unordered_map<std::size_t, std::size_t> redirect_target_;
  std::unordered_map<std::size_t, std::size_t> initiator_;

  std::optional<std::size_t> root_;
};

} // namespace chains::registry
