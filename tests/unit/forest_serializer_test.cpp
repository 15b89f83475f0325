#include "internal/assembly/forest_serializer.hpp"

#include <google/protobuf/util/message_differencer.h>

#include <cassert>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "internal/util/errors.hpp"
#include "test_records.hpp"

namespace {

using chains::assembly::Serialize;
using chains::assembly::ToJson;
using google::protobuf::util::MessageDifferencer;
using namespace chains::testing;

namespace v1 = chains::analyzer::v1;

void TestNestedShape() {
  auto forest = Assemble(MockRecords({kHigh, kHigh, kHigh, kHigh}, {{0, 1}, {1, 2}, {1, 3}}));
  auto chains = Serialize(forest);

  assert(chains.chains_size() == 1);
  const auto& root = chains.chains().at("0");
  assert(root.request().request_id() == "0");
  assert(root.request().resource_type() == v1::RESOURCE_TYPE_DOCUMENT);
  assert(root.children_size() == 1);

  const auto& one = root.children().at("1");
  assert(one.request().url() == UrlOf(1));
  assert(one.request().priority() == v1::RESOURCE_PRIORITY_HIGH);
  assert(one.request().initiator().type() == v1::INITIATOR_TYPE_PARSER);
  assert(one.request().initiator().url() == UrlOf(0));
  assert(one.children_size() == 2);
  assert(one.children().at("2").children_size() == 0);
  assert(one.children().at("3").request().request_id() == "3");
}

void TestRecordFieldsSurvive() {
  auto records = MockRecords({kHigh, kHigh}, {{0, 1}});
  records[1].mime_type = "text/css";
  records[1].end_time  = 7.25;

  auto        chains  = Serialize(Assemble(records));
  const auto& request = chains.chains().at("0").children().at("1").request();
  assert(request.mime_type() == "text/css");
  assert(request.start_time() == 1.0);
  assert(request.response_received_time() == 1.5);
  assert(request.end_time() == 7.25);
  assert(request.status_code() == 200);
  assert(request.frame_id() == "1");
  assert(request.finished());
  assert(!request.is_link_preload());
}

void TestSerializationIsRepeatable() {
  auto forest = Assemble(MockRecords(std::vector<chains::model::Priority>(9, kHigh),
                                     {{0, 1}, {1, 2}, {1, 3}, {0, 4}, {4, 5}, {5, 7}, {7, 8}, {5, 6}}));

  auto first  = Serialize(forest);
  auto second = Serialize(forest);
  assert(MessageDifferencer::Equals(first, second));
  assert(ToJson(first) == ToJson(first));
}

void TestJsonUsesProtoFieldNames() {
  auto json = ToJson(Serialize(Assemble(MockRecords({kHigh, kHigh}, {{0, 1}}))));

  assert(json.find("\"chains\"") != std::string::npos);
  assert(json.find("\"request_id\":\"1\"") != std::string::npos);
  assert(json.find("\"resource_type\":\"RESOURCE_TYPE_STYLESHEET\"") != std::string::npos);
  assert(json.find("requestId") == std::string::npos);
}

std::vector<RequestRecord> LinearChain(std::size_t length) {
  std::vector<std::pair<std::size_t, std::size_t>> edges;
  for (std::size_t i = 1; i < length; ++i) {
    edges.emplace_back(i - 1, i);
  }
  return MockRecords(std::vector<chains::model::Priority>(length, kHigh), edges);
}

void TestLongestChainParsesBack() {
  const auto length = chains::assembly::kMaxChainDepth;

  v1::ComputeChainsResponse resp;
  *resp.mutable_chains() = Serialize(Assemble(LinearChain(length)));

  std::string wire;
  const bool  written = resp.SerializeToString(&wire);
  assert(written);

  v1::ComputeChainsResponse parsed;
  const bool                read = parsed.ParseFromString(wire);
  assert(read);
  assert(MessageDifferencer::Equals(resp, parsed));

  std::size_t depth = 0;
  const auto* node  = &parsed.chains().chains().at("0");
  while (true) {
    ++depth;
    if (node->children_size() == 0) {
      break;
    }
    node = &node->children().begin()->second;
  }
  assert(depth == length);
  assert(node->request().request_id() == std::to_string(length - 1));
}

void TestChainTooLongForReadersIsRejected() {
  auto forest = Assemble(LinearChain(chains::assembly::kMaxChainDepth + 1));
  assert(forest.Size() == chains::assembly::kMaxChainDepth + 1);

  bool threw = false;
  try {
    (void)Serialize(forest);
  } catch (const chains::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestEmptyForest() {
  auto chains = Serialize(Assemble({}, ""));
  assert(chains.chains_size() == 0);
  assert(ToJson(chains) == "{}");
}

} // namespace

int main() {
  TestNestedShape();
  TestRecordFieldsSurvive();
  TestSerializationIsRepeatable();
  TestJsonUsesProtoFieldNames();
  TestLongestChainParsesBack();
  TestChainTooLongForReadersIsRejected();
  TestEmptyForest();

  std::cout << "critical_chains_unit_forest_serializer: pass\n";
  return 0;
}
