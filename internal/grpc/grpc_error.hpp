#pragma once

#include <grpcpp/grpcpp.h>

#include "internal/model/error_record.hpp"
#include "internal/util/errors.hpp"

namespace speechmaker::grpc {

/*
  Converts internal exceptions into gRPC status codes.

  Classified errors carry their serialized speechmaker.v1.ErrorRecord in the
  status details.
*/

::grpc::Status ToStatus(const std::exception& e);

::grpc::StatusCode ToStatusCode(model::ErrorCategory category);

} // namespace speechmaker::grpc
