#include "internal/assembly/chain_assembler.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <string>

#include "internal/classifier/criticality_classifier.hpp"
#include "internal/util/errors.hpp"
#include "test_records.hpp"

namespace {

using chains::assembly::ChainAssembler;
using chains::assembly::ChainNode;
using chains::model::Initiator;
using chains::model::InitiatorKind;
using chains::model::RedirectTarget;
using chains::model::RequestRecord;
using chains::model::ResourceType;
using namespace chains::testing;

void TestChainOfFourCriticalRequests() {
  auto forest = Assemble(MockRecords({kHigh, kMedium, kVeryHigh, kHigh}, {{0, 1}, {1, 2}, {2, 3}}));
  assert(Shape(forest) == "0(1(2(3)))");
  assert(forest.Size() == 4);
  assert(&forest.Find("3")->Request() == forest.Registry()->Find("3"));
}

void TestLowPriorityBreaksTheChain() {
  auto forest = Assemble(MockRecords({kMedium, kHigh, kLow, kMedium, kHigh, kVeryLow},
                                     {{0, 1}, {1, 2}, {2, 3}, {3, 4}}));
  assert(Shape(forest) == "0(1)");
  assert(forest.Find("3") == nullptr);
  assert(forest.Find("4") == nullptr);
}

void TestDisconnectedRequestsArePruned() {
  auto forest = Assemble(MockRecords({kHigh, kHigh, kHigh, kHigh}, {{0, 2}, {1, 3}}));
  assert(Shape(forest) == "0(2)");
  assert(forest.Find("1") == nullptr);
  assert(forest.Find("3") == nullptr);
}

void TestUnresolvableInitiatorPrunesSubtree() {
  auto records         = MockRecords({kHigh, kHigh, kHigh, kHigh}, {{0, 1}, {2, 3}});
  records[2].initiator = Initiator{InitiatorKind::kParser, "https://nowhere.test/x"};

  auto forest = Assemble(records);
  assert(Shape(forest) == "0(1)");
  assert(forest.Find("2") == nullptr);
  assert(forest.Find("3") == nullptr);
}

void TestForkBelowTheRoot() {
  auto forest = Assemble(MockRecords({kHigh, kHigh, kHigh, kHigh}, {{0, 1}, {1, 2}, {1, 3}}));
  assert(Shape(forest) == "0(1(2,3))");
  assert(Ordered(*forest.Roots()[0]) == "0(1(2,3))");
}

void TestRootAlone() {
  auto forest = Assemble(MockRecords({kVeryHigh, kLow}, {{0, 1}}));
  assert(Shape(forest) == "0");
  assert(forest.Roots().size() == 1);
  assert(forest.Roots()[0]->Children().empty());
}

void TestBigGraphKeepsEveryEdge() {
  auto forest = Assemble(MockRecords(std::vector<chains::model::Priority>(9, kHigh),
                                     {{0, 1}, {1, 2}, {1, 3}, {0, 4}, {4, 5}, {5, 7}, {7, 8}, {5, 6}}));
  assert(Shape(forest) == "0(1(2,3),4(5(6,7(8))))");
  assert(forest.Size() == 9);
}

void TestFaviconsAreDropped() {
  auto records = MockRecords({kHigh, kHigh, kHigh, kHigh}, {{0, 1}, {0, 2}, {0, 3}});
  records[1].url       = "https://example.com/favicon.ico";
  records[1].mime_type = "image/x-icon";
  records[2].url       = "https://example.com/favicon-32x32.png";
  records[2].mime_type = "image/png";
  records[3].url       = "https://example.com/android-chrome-192x192.png";
  records[3].mime_type = "image/png";

  assert(Shape(Assemble(records)) == "0");
}

void TestStylesheetNamedLikeFaviconStaysCritical() {
  auto records = MockRecords({kHigh, kHigh}, {{0, 1}});
  records[1].url = "https://www.example.com/favicons-theme.css";

  assert(Shape(Assemble(records)) == "0(1)");
}

void TestFaviconTakesItsChildrenWithIt() {
  auto records = MockRecords({kHigh, kHigh, kHigh}, {{0, 1}});
  records[1].url       = "https://www.example.com/favicon.ico";
  records[2].initiator = Initiator{InitiatorKind::kParser, records[1].url};

  assert(Shape(Assemble(records)) == "0");
}

void TestIframesAreDropped() {
  auto records = MockRecords({kHigh, kHigh, kHigh, kHigh}, {{0, 1}, {0, 2}, {0, 3}});

  records[0].mime_type     = "text/html";
  records[1].url           = "https://example.com/iframe.html";
  records[1].mime_type     = "text/html";
  records[1].resource_type = ResourceType::kDocument;
  records[1].frame_id      = "2";
  records[2].url           = "https://youtube.com/";
  records[2].mime_type     = "text/html";
  records[2].resource_type = ResourceType::kDocument;
  records[2].frame_id      = "3";

  // Reached through a redirect whose destination is a document in another frame.
  records[3].url                  = "https://example.com/redirect-iframe";
  records[3].resource_type        = ResourceType::kUnspecified;
  records[3].status_code          = 302;
  records[3].frame_id             = "4";
  records[3].redirect_destination = RedirectTarget{"", ResourceType::kDocument, kLow, "", ""};

  assert(Shape(Assemble(records)) == "0");
}

void TestPreloadIsDropped() {
  auto records               = MockRecords({kHigh, kHigh}, {{0, 1}});
  records[1].is_link_preload = true;
  assert(Shape(Assemble(records)) == "0");
}

void TestReversedInputBuildsTheSameTree() {
  auto records = MockRecords({kHigh, kHigh}, {{0, 1}});
  std::reverse(records.begin(), records.end());

  auto forest = Assemble(records);
  assert(Shape(forest) == "0(1)");
  assert(forest.Roots()[0]->Request().id == "0");
}

void TestRedirectChainRendersHopsAndHangsDependentsOnTerminal() {
  auto records = MockRecords({kHigh, kHigh, kHigh, kHigh, kHigh}, {{0, 1}, {2, 3}, {1, 4}});

  // 1 is a 302 into 2; both fetch the same logical stylesheet.
  records[1].resource_type        = ResourceType::kUnspecified;
  records[1].status_code          = 302;
  records[1].redirect_destination = RedirectTarget{"2", ResourceType::kStylesheet, kHigh, "1", UrlOf(2)};
  records[2].initiator.reset();

  auto forest = Assemble(records);

  // 3 names the final URL, 4 the original one; both land under hop 2.
  assert(Shape(forest) == "0(1(2(3,4)))");
  assert(forest.Find("1")->Children().size() == 1);
}

void TestRedirectToNonCriticalTerminalIsDropped() {
  auto records = MockRecords({kHigh, kHigh, kLow, kHigh}, {{0, 1}, {2, 3}});
  records[1].resource_type        = ResourceType::kUnspecified;
  records[1].priority             = chains::model::Priority::kUnspecified;
  records[1].redirect_destination = RedirectTarget{"2", {}, {}, {}, {}};
  records[2].initiator.reset();

  assert(Shape(Assemble(records)) == "0");
}

void TestMainDocumentRedirect() {
  auto records = MockRecords({kHigh, kVeryHigh, kHigh}, {{1, 2}});
  records[0].status_code          = 301;
  records[0].redirect_destination = RedirectTarget{"1", ResourceType::kDocument, kVeryHigh, "1", UrlOf(1)};
  records[1].resource_type        = ResourceType::kDocument;

  auto forest = Assemble(records, UrlOf(1));
  assert(Shape(forest) == "0(1(2))");
}

void TestOrderIndependence() {
  const auto records = MockRecords(std::vector<chains::model::Priority>(9, kHigh),
                                   {{0, 1}, {1, 2}, {1, 3}, {0, 4}, {4, 5}, {5, 7}, {7, 8}, {5, 6}});

  const auto forward = Ordered(*Assemble(records).Roots()[0]);

  auto reversed = records;
  std::reverse(reversed.begin(), reversed.end());
  assert(Ordered(*Assemble(reversed).Roots()[0]) == forward);

  auto rotated = records;
  std::rotate(rotated.begin(), rotated.begin() + 4, rotated.end());
  assert(Ordered(*Assemble(rotated).Roots()[0]) == forward);

  // Repeated invocation over the same input.
  assert(Ordered(*Assemble(records).Roots()[0]) == forward);
}

void TestEveryNodeIsOnACriticalPath() {
  auto records = MockRecords({kHigh, kHigh, kLow, kHigh, kHigh, kMedium, kVeryLow, kHigh},
                             {{0, 1}, {0, 2}, {2, 3}, {1, 4}, {4, 5}, {5, 6}, {6, 7}});

  auto registry = MakeRegistry(records, UrlOf(0));
  auto forest   = ChainAssembler().Assemble(registry);
  chains::classifier::CriticalityClassifier classifier(*registry, chains::classifier::ClassifierOptions::Defaults());

  std::vector<const ChainNode*> pending(forest.Roots().begin(), forest.Roots().end());
  std::size_t                   visited = 0;
  while (!pending.empty()) {
    const auto* node = pending.back();
    pending.pop_back();
    ++visited;
    assert(classifier.IsCritical(node->Request()));
    for (const auto* child : node->Children()) {
      pending.push_back(child);
    }
  }

  assert(visited == forest.Size());
  assert(Shape(forest) == "0(1(4(5)))");
}

void TestAssemblyWithoutDeclaredMainDocument() {
  auto forest = Assemble(MockRecords({kHigh, kHigh, kHigh}, {{0, 1}, {1, 2}}), "");
  assert(Shape(forest) == "0(1(2))");
}

void TestEmptyInputYieldsEmptyForest() {
  auto forest = Assemble({}, "");
  assert(forest.Empty());
  assert(forest.Roots().empty());
}

void TestMalformedInputFailsFast() {
  auto records  = MockRecords({kHigh, kHigh}, {{0, 1}});
  records[1].id = "0";

  bool threw = false;
  try {
    (void)Assemble(records);
  } catch (const chains::util::PreconditionViolation&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestChainOfFourCriticalRequests();
  TestLowPriorityBreaksTheChain();
  TestDisconnectedRequestsArePruned();
  TestUnresolvableInitiatorPrunesSubtree();
  TestForkBelowTheRoot();
  TestRootAlone();
  TestBigGraphKeepsEveryEdge();
  TestFaviconsAreDropped();
  TestFaviconTakesItsChildrenWithIt();
  TestStylesheetNamedLikeFaviconStaysCritical();
  TestIframesAreDropped();
  TestPreloadIsDropped();
  TestReversedInputBuildsTheSameTree();
  TestRedirectChainRendersHopsAndHangsDependentsOnTerminal();
  TestRedirectToNonCriticalTerminalIsDropped();
  TestMainDocumentRedirect();
  TestOrderIndependence();
  TestEveryNodeIsOnACriticalPath();
  TestAssemblyWithoutDeclaredMainDocument();
  TestEmptyInputYieldsEmptyForest();
  TestMalformedInputFailsFast();

  std::cout << "critical_chains_unit_chain_assembler: pass\n";
  return 0;
}
