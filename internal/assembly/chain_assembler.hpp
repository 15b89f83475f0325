#pragma once

#include <memory>

#include "internal/assembly/forest.hpp"
#include "internal/classifier/criticality_classifier.hpp"
#include "internal/registry/request_registry.hpp"

namespace chains::assembly {

/*
  Builds the critical request forest from a registry.

  A request is attached only when every request between it and the root
  document is critical: the previous hop for a redirect hop, otherwise
  the terminal hop of the chain holding its resolved initiator. The
  result does not depend on the order the records were supplied in.
*/
class ChainAssembler {
 public:
  explicit ChainAssembler(classifier::ClassifierOptions options = classifier::ClassifierOptions::Defaults());

  Forest Assemble(std::shared_ptr<const registry::RequestRegistry> registry) const;

 private:
  classifier::ClassifierOptions options_;
};

} // namespace chains::assembly
