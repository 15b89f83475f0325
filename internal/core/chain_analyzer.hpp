#pragma once

#include <string>

#include <google/protobuf/repeated_field.h>

#include "chains/analyzer/v1.hpp"
#include "internal/assembly/chain_assembler.hpp"
#include "internal/assembly/forest.hpp"
#include "internal/classifier/criticality_classifier.hpp"

namespace chains::core {

/*
  Request list in, critical request chains out.

  Stateless apart from its classifier options; safe to share between
  threads. Precondition violations propagate as util::PreconditionViolation.
*/
class ChainAnalyzer {
 public:
  explicit ChainAnalyzer(classifier::ClassifierOptions options = classifier::ClassifierOptions::Defaults());

  chains::assembly::Forest Analyze(
      const google::protobuf::RepeatedPtrField<chains::analyzer::v1::NetworkRequest>& records,
      const std::string& main_document_url = {}) const;

  chains::analyzer::v1::CriticalRequestChains Compute(const chains::analyzer::v1::ComputeChainsRequest& request) const;

  const classifier::ClassifierOptions& Options() const {
    return options_;
  }

 private:
  classifier::ClassifierOptions options_;
  assembly::ChainAssembler      assembler_;
};

} // namespace chains::core
