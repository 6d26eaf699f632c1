#pragma once

#include <grpcpp/grpcpp.h>

#include <exception>

namespace tasktree::grpc {

/*
  Converts internal exceptions into gRPC status codes.
*/

::grpc::Status ToStatus(const std::exception& e);

} // namespace tasktree::grpc
