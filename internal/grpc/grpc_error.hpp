#pragma once

#include <exception>

#include <grpcpp/grpcpp.h>

namespace songqueue::grpc {

/*
  Converts internal exceptions into gRPC status codes.
*/

::grpc::Status ToStatus(const std::exception& e);

} // namespace songqueue::grpc
