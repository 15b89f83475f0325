#pragma once

#include "chains/analyzer/v1.hpp"
#include "internal/model/request_record.hpp"

namespace chains::model {

// Values outside the proto enums map to the kUnknown variants.
ResourceType FromProto(chains::analyzer::v1::ResourceType type);
Priority     FromProto(chains::analyzer::v1::ResourcePriority priority);
InitiatorKind FromProto(chains::analyzer::v1::InitiatorType type);

chains::analyzer::v1::ResourceType     ToProto(ResourceType type);
chains::analyzer::v1::ResourcePriority ToProto(Priority priority);
chains::analyzer::v1::InitiatorType    ToProto(InitiatorKind kind);

RequestRecord                        FromProto(const chains::analyzer::v1::NetworkRequest& request);
chains::analyzer::v1::NetworkRequest ToProto(const RequestRecord& record);

} // namespace chains::model
