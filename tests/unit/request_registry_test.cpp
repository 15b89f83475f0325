#include "internal/registry/request_registry.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"
#include "test_records.hpp"

namespace {

using chains::model::InitiatorKind;
using chains::model::RedirectTarget;
using chains::model::RequestRecord;
using chains::model::ResourceType;
using chains::registry::RequestRegistry;
using chains::util::PreconditionViolation;
using namespace chains::testing;

template <typename Fn>
bool ThrowsPrecondition(Fn&& fn) {
  try {
    fn();
  } catch (const PreconditionViolation&) {
    return true;
  }
  return false;
}

void TestLookupById() {
  auto registry = MakeRegistry(MockRecords({kHigh, kHigh, kHigh}, {{0, 1}, {1, 2}}));

  assert(registry->Size() == 3);
  assert(registry->Find("2") && registry->Find("2")->url == UrlOf(2));
  assert(registry->Find("missing") == nullptr);
  assert(registry->Root() && registry->Root()->id == "0");
  assert(registry->InitiatorOf(*registry->Find("2"))->id == "1");
  assert(registry->InitiatorOf(*registry->Find("0")) == nullptr);
}

void TestLookupAcceptsRecordsHeldOutsideRegistry() {
  const auto records  = MockRecords({kHigh, kHigh, kHigh}, {{0, 1}, {1, 2}});
  auto       registry = MakeRegistry(records);

  // The caller's own copies resolve by id to the registry's records.
  assert(registry->InitiatorOf(records[2]) == registry->Find("1"));
  assert(registry->IsRoot(records[0]));

  RequestRecord stranger = records[2];
  stranger.id            = "not-recorded";
  assert(registry->InitiatorOf(stranger) == nullptr);
  assert(!registry->IsRoot(stranger));
}

void TestEmptyRegistryHasNoRoot() {
  RequestRegistry registry(std::vector<RequestRecord>{});
  assert(registry.Empty());
  assert(registry.Root() == nullptr);
}

void TestLookupIsIndependentOfArrivalOrder() {
  auto records = MockRecords({kHigh, kHigh, kHigh}, {{0, 1}, {1, 2}});
  std::reverse(records.begin(), records.end());

  auto registry = MakeRegistry(records);
  assert(registry->Root()->id == "0");
  assert(registry->InitiatorOf(*registry->Find("2"))->id == "1");
}

void TestDuplicateIdsAreRejected() {
  auto records  = MockRecords({kHigh, kHigh}, {{0, 1}});
  records[1].id = "0";
  assert(ThrowsPrecondition([&] { RequestRegistry registry(records); }));
}

void TestRootSelection() {
  // Without a main document URL the earliest initiator-less record wins.
  auto records = MockRecords({kHigh, kHigh, kHigh}, {{0, 2}});
  assert(MakeRegistry(records)->Root()->id == "0");

  // Two candidates starting together is ambiguous.
  records[1].start_time = 0;
  assert(ThrowsPrecondition([&] { RequestRegistry registry(records); }));

  // A declared main document settles it.
  assert(MakeRegistry(records, UrlOf(1))->Root()->id == "1");
}

void TestMainDocumentMustExistAndHaveNoInitiator() {
  auto records = MockRecords({kHigh, kHigh}, {{0, 1}});

  assert(ThrowsPrecondition([&] { RequestRegistry registry(records, "https://elsewhere.example/"); }));
  assert(ThrowsPrecondition([&] { RequestRegistry registry(records, UrlOf(1)); }));

  // Every record has an initiator: nothing can be the root.
  records[0].initiator = chains::model::Initiator{InitiatorKind::kOther, "https://referrer.example/"};
  assert(ThrowsPrecondition([&] { RequestRegistry registry(records); }));
}

void TestInitiatorCandidatesMustHaveResponded() {
  auto records = MockRecords({kHigh, kHigh}, {{0, 1}});

  records[0].response_received_time = 2;
  auto late                         = MakeRegistry(records);
  assert(late->InitiatorOf(*late->Find("1")) == nullptr);

  records[0].response_received_time = 0.5;
  records[0].finished               = false;
  auto unfinished                   = MakeRegistry(records);
  assert(unfinished->InitiatorOf(*unfinished->Find("1")) == nullptr);
}

void TestInitiatorTieBreaks() {
  // Two fetches of the parent URL: 1 is typed Other, 2 is a Document.
  auto records = MockRecords({kHigh, kHigh, kHigh, kHigh}, {{0, 3}});
  records[1].url           = UrlOf(0) + "/page";
  records[1].resource_type = ResourceType::kOther;
  records[2].url           = UrlOf(0) + "/page";
  records[2].resource_type = ResourceType::kStylesheet;
  records[3].initiator     = chains::model::Initiator{InitiatorKind::kScript, UrlOf(0) + "/page"};

  auto registry = MakeRegistry(records);
  assert(registry->InitiatorOf(*registry->Find("3"))->id == "2");

  // Same type: the one in the same frame wins.
  records[1].resource_type = ResourceType::kStylesheet;
  records[1].frame_id      = "9";
  registry                 = MakeRegistry(records);
  assert(registry->InitiatorOf(*registry->Find("3"))->id == "2");

  // Same frame: a parser-initiated request prefers the document.
  records[1].frame_id      = "1";
  records[1].resource_type = ResourceType::kDocument;
  records[3].initiator->kind = InitiatorKind::kParser;
  registry                 = MakeRegistry(records);
  assert(registry->InitiatorOf(*registry->Find("3"))->id == "1");

  // Nothing left to tell them apart: no initiator.
  records[2].resource_type = ResourceType::kDocument;
  registry                 = MakeRegistry(records);
  assert(registry->InitiatorOf(*registry->Find("3")) == nullptr);
}

void TestRedirectLinks() {
  auto records = MockRecords({kHigh, kHigh, kHigh, kHigh}, {{0, 1}});
  records[1].redirect_destination = RedirectTarget{"2", ResourceType::kStylesheet, kHigh, "1", UrlOf(2)};
  records[2].redirect_destination = RedirectTarget{"3", ResourceType::kStylesheet, kHigh, "1", UrlOf(3)};

  auto registry = MakeRegistry(records);
  const auto& one   = *registry->Find("1");
  const auto& two   = *registry->Find("2");
  const auto& three = *registry->Find("3");

  assert(registry->RedirectTargetOf(one) == &two);
  assert(registry->RedirectSourceOf(three) == &two);
  assert(registry->RedirectSourceOf(one) == nullptr);
  assert(registry->InitiatorOf(two) == &one);
  assert(registry->InitiatorOf(three) == &two);
  assert(registry->ResolveDestination(one).url == UrlOf(3));
}

void TestMainDocumentRedirectRootsAtChainHead() {
  auto records = MockRecords({kHigh, kHigh, kHigh}, {{1, 2}});
  records[0].status_code          = 301;
  records[0].redirect_destination = RedirectTarget{"1", ResourceType::kDocument, kVeryHigh, "1", UrlOf(1)};

  auto registry = MakeRegistry(records, UrlOf(1));
  assert(registry->Root()->id == "0");
}

void TestMalformedRedirects() {
  auto records = MockRecords({kHigh, kHigh, kHigh}, {{0, 1}});

  auto self                          = records;
  self[1].redirect_destination       = RedirectTarget{"1", {}, {}, {}, {}};
  assert(ThrowsPrecondition([&] { RequestRegistry registry(self); }));

  auto cycle                         = records;
  cycle[1].redirect_destination      = RedirectTarget{"2", {}, {}, {}, {}};
  cycle[2].redirect_destination      = RedirectTarget{"1", {}, {}, {}, {}};
  assert(ThrowsPrecondition([&] { RequestRegistry registry(cycle); }));

  auto converging                    = records;
  converging[0].redirect_destination = RedirectTarget{"2", {}, {}, {}, {}};
  converging[1].redirect_destination = RedirectTarget{"2", {}, {}, {}, {}};
  assert(ThrowsPrecondition([&] { RequestRegistry registry(converging); }));
}

void TestUncapturedRedirectDestination() {
  auto records = MockRecords({kHigh, kHigh}, {{0, 1}});
  records[1].resource_type        = ResourceType::kUnspecified;
  records[1].frame_id             = "4";
  records[1].redirect_destination = RedirectTarget{"not-recorded", ResourceType::kDocument, kLow, "", "https://frame.example/"};

  auto registry    = MakeRegistry(records);
  auto destination = registry->ResolveDestination(*registry->Find("1"));
  assert(registry->RedirectTargetOf(*registry->Find("1")) == nullptr);
  assert(destination.resource_type == ResourceType::kDocument);
  assert(destination.priority == kLow);
  assert(destination.frame_id == "4");
  assert(destination.url == "https://frame.example/");
}

} // namespace

int main() {
  TestLookupById();
  TestLookupAcceptsRecordsHeldOutsideRegistry();
  TestEmptyRegistryHasNoRoot();
  TestLookupIsIndependentOfArrivalOrder();
  TestDuplicateIdsAreRejected();
  TestRootSelection();
  TestMainDocumentMustExistAndHaveNoInitiator();
  TestInitiatorCandidatesMustHaveResponded();
  TestInitiatorTieBreaks();
  TestRedirectLinks();
  TestMainDocumentRedirectRootsAtChainHead();
  TestMalformedRedirects();
  TestUncapturedRedirectDestination();

  std::cout << "critical_chains_unit_request_registry: pass\n";
  return 0;
}
