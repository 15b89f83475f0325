#include "internal/assembly/forest_serializer.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>
#include <string>

#include "internal/model/proto_convert.hpp"
#include "internal/util/errors.hpp"

namespace chains::assembly {

namespace v1 = chains::analyzer::v1;

namespace {

void Render(const ChainNode& node, v1::ChainNode* out, std::size_t depth) {
  if (depth > kMaxChainDepth) {
    throw util::InvalidArgument("critical chain through " + node.Id() + " is longer than " +
                                std::to_string(kMaxChainDepth) + " requests");
  }

  *out->mutable_request() = model::ToProto(node.Request());

  auto* children = out->mutable_children();
  for (const auto* child : node.Children()) {
    Render(*child, &(*children)[child->Id()], depth + 1);
  }
}

} // namespace

v1::CriticalRequestChains Serialize(const Forest& forest) {
  v1::CriticalRequestChains out;
  auto*                     chains = out.mutable_chains();
  for (const auto* root : forest.Roots()) {
    Render(*root, &(*chains)[root->Id()], 1);
  }
  return out;
}

std::string ToJson(const v1::CriticalRequestChains& chains, bool pretty) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;
  options.add_whitespace             = pretty;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(chains, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("failed to render chains as JSON: " + status.ToString());
  }
  return json;
}

} // namespace chains::assembly
