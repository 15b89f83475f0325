#pragma once

#include "chains/analyzer/v1.hpp"

#include "chains/analyzer/services/v1/chain_service.grpc.pb.h"
#include "chains/analyzer/services/v1/admin_service.grpc.pb.h"
