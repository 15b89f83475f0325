#pragma once

#include "chains/analyzer/core/v1/network.pb.h"
#include "chains/analyzer/core/v1/chains.pb.h"

#include "chains/analyzer/services/v1/chain_service.pb.h"
#include "chains/analyzer/services/v1/admin_service.pb.h"

namespace chains::analyzer::v1 {
using namespace ::chains::analyzer::core::v1;
using namespace ::chains::analyzer::services::v1;
}
