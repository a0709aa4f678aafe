#include "grpc_error.hpp"

#include "internal/errors/classified_error.hpp"
#include "internal/service/proto_mapping.hpp"

namespace speechmaker::grpc {

::grpc::StatusCode ToStatusCode(model::ErrorCategory category) {
  using model::ErrorCategory;

  switch (category) {
    case ErrorCategory::kCancelled:
      return ::grpc::StatusCode::CANCELLED;
    case ErrorCategory::kFileNotFound:
      return ::grpc::StatusCode::NOT_FOUND;
    case ErrorCategory::kAccessDenied:
      return ::grpc::StatusCode::PERMISSION_DENIED;
    case ErrorCategory::kUnsupportedFile:
    case ErrorCategory::kFileTooLarge:
    case ErrorCategory::kEmptyInput:
    case ErrorCategory::kIsDirectory:
      return ::grpc::StatusCode::INVALID_ARGUMENT;
    case ErrorCategory::kVoiceUnavailable:
    case ErrorCategory::kConverterMissing:
    case ErrorCategory::kOutputLocation:
      return ::grpc::StatusCode::FAILED_PRECONDITION;
    case ErrorCategory::kEngineUnresponsive:
      return ::grpc::StatusCode::UNAVAILABLE;
    case ErrorCategory::kTooManyOpenFiles:
      return ::grpc::StatusCode::RESOURCE_EXHAUSTED;
    default:
      return ::grpc::StatusCode::INTERNAL;
  }
}

::grpc::Status ToStatus(const std::exception& e) {
  using namespace speechmaker::util;

  if (const auto* classified = dynamic_cast<const errors::ClassifiedError*>(&e)) {
    return {ToStatusCode(classified->record().category), e.what(),
            service::ToProto(classified->record()).SerializeAsString()};
  }
  if (dynamic_cast<const InvalidArgument*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const InvalidState*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const ResourceExhausted*>(&e)) {
    return {::grpc::StatusCode::RESOURCE_EXHAUSTED, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace speechmaker::grpc
