#include "grpc_error.hpp"

namespace elevator::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace elevator::util;

  if (dynamic_cast<const ValidationError*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const ConfigurationError*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace elevator::grpc
