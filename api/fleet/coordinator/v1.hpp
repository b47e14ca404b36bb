#pragma once

#include "fleet/coordinator/core/v1/types.pb.h"

#include "fleet/coordinator/services/v1/fleet_agent_service.pb.h"
#include "fleet/coordinator/services/v1/fleet_admin_service.pb.h"

#include "fleet/coordinator/services/v1/fleet_agent_service.grpc.pb.h"
#include "fleet/coordinator/services/v1/fleet_admin_service.grpc.pb.h"

namespace fleet::coordinator::v1 {
using namespace ::fleet::coordinator::core::v1;
using namespace ::fleet::coordinator::services::v1;
}
