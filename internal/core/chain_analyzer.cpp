#include "internal/core/chain_analyzer.hpp"

#include <utility>

#include "internal/assembly/forest_serializer.hpp"
#include "internal/registry/request_registry.hpp"

namespace chains::core {

namespace v1 = chains::analyzer::v1;

ChainAnalyzer::ChainAnalyzer(classifier::ClassifierOptions options)
    : options_(std::move(options)), assembler_(options_) {
}

assembly::Forest ChainAnalyzer::Analyze(const google::protobuf::RepeatedPtrField<v1::NetworkRequest>& records,
                                        const std::string& main_document_url) const {
  auto registry = registry::RequestRegistry::FromProto(records, main_document_url);
  return assembler_.Assemble(std::move(registry));
}

v1::CriticalRequestChains ChainAnalyzer::Compute(const v1::ComputeChainsRequest& request) const {
  auto forest = Analyze(request.records(), request.main_document_url());
  return assembly::Serialize(forest);
}

} // namespace chains::core
