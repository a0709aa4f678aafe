#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/speech_service.hpp"
#include "speechmaker/v1/speech_service.grpc.pb.h"

namespace speechmaker::grpc {

class SpeechServer final : public speechmaker::v1::SpeechMakerService::Service {
 public:
  explicit SpeechServer(std::shared_ptr<speechmaker::service::SpeechService> svc);

  ::grpc::Status GetReadiness(::grpc::ServerContext*, const speechmaker::v1::GetReadinessRequest*,
                              speechmaker::v1::GetReadinessResponse*) override;
  ::grpc::Status WatchReadiness(::grpc::ServerContext*, const speechmaker::v1::WatchReadinessRequest*,
                                ::grpc::ServerWriter<speechmaker::v1::ReadinessUpdate>*) override;
  ::grpc::Status ListVoices(::grpc::ServerContext*, const speechmaker::v1::ListVoicesRequest*,
                            speechmaker::v1::ListVoicesResponse*) override;
  ::grpc::Status RetryVoiceLoading(::grpc::ServerContext*, const speechmaker::v1::RetryVoiceLoadingRequest*,
                                   speechmaker::v1::RetryVoiceLoadingResponse*) override;
  ::grpc::Status GetConverterStatus(::grpc::ServerContext*, const speechmaker::v1::GetConverterStatusRequest*,
                                    speechmaker::v1::GetConverterStatusResponse*) override;
  ::grpc::Status Reinitialize(::grpc::ServerContext*, const speechmaker::v1::ReinitializeRequest*,
                              speechmaker::v1::ReinitializeResponse*) override;
  ::grpc::Status SetOutputFolder(::grpc::ServerContext*, const speechmaker::v1::SetOutputFolderRequest*,
                                 speechmaker::v1::SetOutputFolderResponse*) override;

  ::grpc::Status Convert(::grpc::ServerContext*, const speechmaker::v1::ConvertRequest*,
                         ::grpc::ServerWriter<speechmaker::v1::ConversionEvent>*) override;

  ::grpc::Status Cancel(::grpc::ServerContext*, const speechmaker::v1::CancelRequest*,
                        speechmaker::v1::CancelResponse*) override;
  ::grpc::Status GetRecentErrors(::grpc::ServerContext*, const speechmaker::v1::GetRecentErrorsRequest*,
                                 speechmaker::v1::GetRecentErrorsResponse*) override;
  ::grpc::Status GetErrorStatistics(::grpc::ServerContext*, const speechmaker::v1::GetErrorStatisticsRequest*,
                                    speechmaker::v1::GetErrorStatisticsResponse*) override;
  ::grpc::Status ClearErrors(::grpc::ServerContext*, const speechmaker::v1::ClearErrorsRequest*,
                             speechmaker::v1::ClearErrorsResponse*) override;
  ::grpc::Status ResetRetries(::grpc::ServerContext*, const speechmaker::v1::ResetRetriesRequest*,
                              speechmaker::v1::ResetRetriesResponse*) override;

 private:
  std::shared_ptr<speechmaker::service::SpeechService> service_;
};

} // namespace speechmaker::grpc
