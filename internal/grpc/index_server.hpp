#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/index_service.hpp"
#include "tasktree/v1/index_service.grpc.pb.h"

namespace tasktree::grpc {

class IndexServer final : public tasktree::v1::TaskIndexService::Service {
 public:
  explicit IndexServer(std::shared_ptr<tasktree::service::IndexService> svc);

  ::grpc::Status IndexTask(::grpc::ServerContext*, const tasktree::v1::IndexTaskRequest*, tasktree::v1::IndexTaskResponse*) override;

  ::grpc::Status ResetCollection(::grpc::ServerContext*, const tasktree::v1::ResetCollectionRequest*, tasktree::v1::ResetCollectionResponse*) override;

  ::grpc::Status Search(::grpc::ServerContext*, const tasktree::v1::SearchRequest*, tasktree::v1::SearchResponse*) override;

  ::grpc::Status GetCollectionHealth(::grpc::ServerContext*, const tasktree::v1::GetCollectionHealthRequest*,
                                     tasktree::v1::GetCollectionHealthResponse*) override;

 private:
  std::shared_ptr<tasktree::service::IndexService> service_;
};

} // namespace tasktree::grpc
