#pragma once

#include "tasktree/v1/types.pb.h"

#include "tasktree/v1/index_service.pb.h"
#include "tasktree/v1/tree_service.pb.h"

#include "tasktree/v1/index_service.grpc.pb.h"
#include "tasktree/v1/tree_service.grpc.pb.h"
