#include "factory.hpp"

#include <cstdint>
#include <memory>
#include <utility>

#include "internal/cache/chain_cache.hpp"
#include "internal/classifier/criticality_classifier.hpp"
#include "internal/core/chain_analyzer.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/chain_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/chain_service.hpp"

namespace chains::factory {

/*
    Build full application dependency graph
*/
Application Build(const chains::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  auto options  = classifier::ClassifierOptions::FromConfig(config.classifier());
  auto analyzer = std::make_shared<core::ChainAnalyzer>(std::move(options));

  std::shared_ptr<cache::ChainCache> chain_cache;
  if (config.cache().enabled()) {
    chain_cache = std::make_shared<cache::ChainCache>(static_cast<std::size_t>(config.cache().max_entries()));
  }

  CHAINS_LOG_INFO("analyzer configured",
                  {observability::StringField("min_priority", model::ToString(analyzer->Options().min_priority)),
                   observability::BoolField("cache_enabled", static_cast<bool>(chain_cache)),
                   observability::IntField("cache_max_entries", static_cast<std::int64_t>(config.cache().max_entries()))});

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.analyzer = analyzer;
  ctx.cache    = chain_cache;
  ctx.stats    = std::make_shared<service::ComputeStats>();

  auto chain_service = std::make_shared<service::ChainService>(ctx);
  auto admin_service = std::make_shared<service::AdminService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::ChainServer>(chain_service));
  app.grpc_services.push_back(std::make_unique<grpc::AdminServer>(admin_service));

  app.context = std::move(ctx);
  return app;
}

} // namespace chains::factory
