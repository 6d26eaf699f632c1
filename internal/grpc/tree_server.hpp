#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/tree_service.hpp"
#include "tasktree/v1/tree_service.grpc.pb.h"

namespace tasktree::grpc {

class TreeServer final : public tasktree::v1::TaskTreeService::Service {
 public:
  explicit TreeServer(std::shared_ptr<tasktree::service::TreeService> svc);

  ::grpc::Status GetChildren(::grpc::ServerContext*, const tasktree::v1::GetChildrenRequest*, tasktree::v1::GetChildrenResponse*) override;

  ::grpc::Status GetParent(::grpc::ServerContext*, const tasktree::v1::GetParentRequest*, tasktree::v1::GetParentResponse*) override;

  ::grpc::Status GetTree(::grpc::ServerContext*, const tasktree::v1::GetTreeRequest*, tasktree::v1::GetTreeResponse*) override;

  ::grpc::Status GetResolutionStats(::grpc::ServerContext*, const tasktree::v1::GetResolutionStatsRequest*,
                                    tasktree::v1::GetResolutionStatsResponse*) override;

 private:
  std::shared_ptr<tasktree::service::TreeService> service_;
};

} // namespace tasktree::grpc
