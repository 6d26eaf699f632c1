#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>
#include <vector>

#include "config/config.pb.h"

namespace tasktree::health {
class CollectionHealthMonitor;
}
namespace tasktree::indexing {
class RateLimiter;
}
namespace tasktree::service {
class TreeService;
class IndexService;
}

namespace tasktree::factory {

/*
  Application

  Owns every long-lived object of the server. Everything here lives for
  the lifetime of the process.
*/
struct Application {
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;

  std::shared_ptr<tasktree::service::TreeService>  tree_service;
  std::shared_ptr<tasktree::service::IndexService> index_service;

  std::shared_ptr<tasktree::health::CollectionHealthMonitor> health_monitor;
  std::shared_ptr<tasktree::indexing::RateLimiter>           rate_limiter;

  // Stops the health poller and drains the upsert queue.
  void Shutdown();
};

/*
  Build

  Constructs the whole dependency graph from runtime config. This is the
  composition root: the only place that knows concrete scanner, embedder
  and vector store types.
*/
Application Build(const tasktree::runtime::config::RuntimeConfig& config);

} // namespace tasktree::factory
