#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"
#include "internal/core/fleet_policy.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/time.hpp"

namespace fleet::reaper {
class ReaperWorker;
}
namespace fleet::http {
class HttpGateway;
}

namespace fleet::factory {

/*
  Everything the process runs. Nothing is started here; main starts gRPC,
  then the HTTP gateway, then the reaper, and stops them in reverse.
*/
struct Application {
  std::shared_ptr<db::Repository>               repository;
  service::ServiceContext                       context;
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
  std::shared_ptr<http::HttpGateway>            http_gateway;  // null when disabled
  std::shared_ptr<reaper::ReaperWorker>         reaper_worker; // null when disabled
};

// The core object graph over one repository. Tests use it with ManualClock.
service::ServiceContext BuildServiceContext(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::Clock> clock,
                                            const core::FleetPolicy& policy, const core::ReaperOptions& reaper_options);

// Opens (and bootstraps) the configured store. Throws if the backend was not built in.
std::shared_ptr<db::Repository> BuildRepository(const fleet::runtime::config::RuntimeConfig& config);

/*
  Composition root: the only place that knows concrete store types.
*/
Application Build(const fleet::runtime::config::RuntimeConfig& config);

} // namespace fleet::factory
