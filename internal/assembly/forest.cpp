#include "internal/assembly/forest.hpp"

#include <algorithm>
#include <utility>

namespace chains::assembly {

const ChainNode* ChainNode::Child(const std::string& id) const {
  auto it = std::find_if(children_.begin(), children_.end(), [&id](const ChainNode* child) {
    return child->Id() == id;
  });
  return it == children_.end() ? nullptr : *it;
}

bool ChainNode::AddChild(const ChainNode& child) {
  if (Child(child.Id())) {
    return false;
  }
  children_.push_back(&child);
  return true;
}

Forest::Forest(std::shared_ptr<const registry::RequestRegistry> registry) : registry_(std::move(registry)) {
}

const ChainNode* Forest::Find(const std::string& id) const {
  auto it = nodes_.find(id);
  return it == nodes_.end() ? nullptr : it->second.get();
}

ChainNode& Forest::GetOrCreate(const model::RequestRecord& record) {
  auto& slot = nodes_[record.id];
  if (!slot) {
    slot = std::make_unique<ChainNode>(record);
  }
  return *slot;
}

void Forest::AddRoot(const ChainNode& node) {
  if (std::find(roots_.begin(), roots_.end(), &node) == roots_.end()) {
    roots_.push_back(&node);
  }
}

} // namespace chains::assembly
