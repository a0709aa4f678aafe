#include "speech_server.hpp"

#include "grpc_error.hpp"
#include "speechmaker/v1.hpp"

namespace speechmaker::grpc {

using namespace speechmaker::v1;

SpeechServer::SpeechServer(std::shared_ptr<speechmaker::service::SpeechService> svc) : service_(std::move(svc)) {
}

::grpc::Status SpeechServer::GetReadiness(::grpc::ServerContext*, const GetReadinessRequest* req,
                                          GetReadinessResponse* resp) {
  try {
    *resp = service_->GetReadiness(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SpeechServer::ListVoices(::grpc::ServerContext*, const ListVoicesRequest* req,
                                        ListVoicesResponse* resp) {
  try {
    *resp = service_->ListVoices(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SpeechServer::RetryVoiceLoading(::grpc::ServerContext*, const RetryVoiceLoadingRequest* req,
                                               RetryVoiceLoadingResponse* resp) {
  try {
    *resp = service_->RetryVoiceLoading(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SpeechServer::GetConverterStatus(::grpc::ServerContext*, const GetConverterStatusRequest* req,
                                                GetConverterStatusResponse* resp) {
  try {
    *resp = service_->GetConverterStatus(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SpeechServer::Reinitialize(::grpc::ServerContext*, const ReinitializeRequest* req,
                                          ReinitializeResponse* resp) {
  try {
    *resp = service_->Reinitialize(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SpeechServer::SetOutputFolder(::grpc::ServerContext*, const SetOutputFolderRequest* req,
                                             SetOutputFolderResponse* resp) {
  try {
    *resp = service_->SetOutputFolder(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SpeechServer::WatchReadiness(::grpc::ServerContext* ctx, const WatchReadinessRequest* req,
                                            ::grpc::ServerWriter<ReadinessUpdate>* writer) {
  try {
    service_->WatchReadiness(
        *req, [&](const ReadinessUpdate& update) { return !ctx->IsCancelled() && writer->Write(update); },
        [ctx] { return ctx->IsCancelled(); });
    if (ctx->IsCancelled()) {
      return ::grpc::Status::CANCELLED;
    }
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SpeechServer::Convert(::grpc::ServerContext* ctx, const ConvertRequest* req,
                                     ::grpc::ServerWriter<ConversionEvent>* writer) {
  try {
    // A closed stream or a cancelled call stops the session.
    service_->Convert(*req, [&](const ConversionEvent& event) {
      return !ctx->IsCancelled() && writer->Write(event);
    });
    if (ctx->IsCancelled()) {
      return ::grpc::Status::CANCELLED;
    }
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SpeechServer::Cancel(::grpc::ServerContext*, const CancelRequest* req, CancelResponse* resp) {
  try {
    *resp = service_->Cancel(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SpeechServer::GetRecentErrors(::grpc::ServerContext*, const GetRecentErrorsRequest* req,
                                             GetRecentErrorsResponse* resp) {
  try {
    *resp = service_->GetRecentErrors(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SpeechServer::GetErrorStatistics(::grpc::ServerContext*, const GetErrorStatisticsRequest* req,
                                                GetErrorStatisticsResponse* resp) {
  try {
    *resp = service_->GetErrorStatistics(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SpeechServer::ClearErrors(::grpc::ServerContext*, const ClearErrorsRequest* req,
                                         ClearErrorsResponse* resp) {
  try {
    *resp = service_->ClearErrors(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SpeechServer::ResetRetries(::grpc::ServerContext*, const ResetRetriesRequest* req,
                                          ResetRetriesResponse* resp) {
  try {
    *resp = service_->ResetRetries(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace speechmaker::grpc
