#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/model/request_record.hpp"
#include "internal/registry/request_registry.hpp"

namespace chains::assembly {

/*
  Entry of the critical request forest.

  Children keep the order in which they were discovered. A node never
  holds the same child twice.
*/
class ChainNode {
 public:
  explicit ChainNode(const model::RequestRecord& request) : request_(&request) {
  }

  const model::RequestRecord& Request() const {
    return *request_;
  }

  const std::string& Id() const {
    return request_->id;
  }

  const std::vector<const ChainNode*>& Children() const {
    return children_;
  }

  const ChainNode* Child(const std::string& id) const;

  // Returns false when the child was already attached.
  bool AddChild(const ChainNode& child);

 private:
  const model::RequestRecord*   request_;
  std::vector<const ChainNode*> children_;
};

/*
  Forest of critical request chains.

  Nodes live in an arena keyed by request id, so every reference to a
  request resolves to the same node. The forest pins the registry that
  owns the records it points at and is immutable once assembled.
*/
class Forest {
 public:
  Forest() = default;
  explicit Forest(std::shared_ptr<const registry::RequestRegistry> registry);

  Forest(Forest&&) noexcept            = default;
  Forest& operator=(Forest&&) noexcept = default;

  Forest(const Forest&)            = delete;
  Forest& operator=(const Forest&) = delete;

  const std::vector<const ChainNode*>& Roots() const {
    return roots_;
  }

  const ChainNode* Find(const std::string& id) const;

  std::size_t Size() const {
    return nodes_.size();
  }

  bool Empty() const {
    return nodes_.empty();
  }

  const std::shared_ptr<const registry::RequestRegistry>& Registry() const {
    return registry_;
  }

 private:
  friend class ChainAssembler;

  ChainNode& GetOrCreate(const model::RequestRecord& record);
  void       AddRoot(const ChainNode& node);

  std::shared_ptr<const registry::RequestRegistry>            registry_;
  std::unordered_map<std::string, std::unique_ptr<ChainNode>> nodes_;
  std::vector<const ChainNode*>                               roots_;
};

} // namespace chains::assembly
