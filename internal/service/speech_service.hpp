#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>

#include "internal/service/service_context.hpp"
#include "internal/util/deadline.hpp"
#include "speechmaker/v1.hpp"

namespace speechmaker::service {

/*
  SpeechService

  Application facade over the resolver, readiness state, orchestrator and
  error log. Transport adapters call it with wire messages.
*/
class SpeechService {
 public:
  // Receives conversion events; returning false cancels the session.
  using EventSink = std::function<bool(const speechmaker::v1::ConversionEvent&)>;
  // Receives readiness updates; returning false ends the watch.
  using ReadinessSink = std::function<bool(const speechmaker::v1::ReadinessUpdate&)>;
  // Polled while a watch is idle; true ends it.
  using StopCheck = std::function<bool()>;

  explicit SpeechService(ServiceContext ctx);
  ~SpeechService();

  SpeechService(const SpeechService&)            = delete;
  SpeechService& operator=(const SpeechService&) = delete;

  // Resolves converter and voices in parallel, then leaves initializing state.
  void Initialize();
  // Runs Initialize() on a background thread.
  void StartInitialization();
  void WaitForInitialization();

  // Cancels resource lookups and running sessions, and ends readiness watches.
  void Shutdown();

  speechmaker::v1::GetReadinessResponse GetReadiness(const speechmaker::v1::GetReadinessRequest& req);

  // Streams the current snapshot, then changes on the requested topics with
  // non-decreasing sequence numbers, until the sink refuses, `stop` returns true or the
  // service shuts down. Throws util::InvalidArgument for an unknown topic.
  void WatchReadiness(const speechmaker::v1::WatchReadinessRequest& req, const ReadinessSink& sink,
                      const StopCheck& stop = {});
  speechmaker::v1::ListVoicesResponse   ListVoices(const speechmaker::v1::ListVoicesRequest& req);
  speechmaker::v1::RetryVoiceLoadingResponse RetryVoiceLoading(const speechmaker::v1::RetryVoiceLoadingRequest& req);
  speechmaker::v1::GetConverterStatusResponse GetConverterStatus(const speechmaker::v1::GetConverterStatusRequest& req);
  speechmaker::v1::ReinitializeResponse    Reinitialize(const speechmaker::v1::ReinitializeRequest& req);
  speechmaker::v1::SetOutputFolderResponse SetOutputFolder(const speechmaker::v1::SetOutputFolderRequest& req);

  // Throws util::InvalidState when not ready and util::InvalidArgument for bad
  // parameters. Once a session exists every outcome is reported through the
  // sink; the terminal event is also returned.
  speechmaker::v1::ConversionEvent Convert(const speechmaker::v1::ConvertRequest& req, const EventSink& sink);

  std::size_t ActiveSessionCount() const;

  speechmaker::v1::CancelResponse             Cancel(const speechmaker::v1::CancelRequest& req);
  speechmaker::v1::GetRecentErrorsResponse    GetRecentErrors(const speechmaker::v1::GetRecentErrorsRequest& req);
  speechmaker::v1::GetErrorStatisticsResponse GetErrorStatistics(const speechmaker::v1::GetErrorStatisticsRequest& req);
  speechmaker::v1::ClearErrorsResponse        ClearErrors(const speechmaker::v1::ClearErrorsRequest& req);
  speechmaker::v1::ResetRetriesResponse       ResetRetries(const speechmaker::v1::ResetRetriesRequest& req);

 private:
  void ApplyDefaultOutputFolder();
  void LoadVoices();

  ServiceContext ctx_;

  mutable std::mutex                             sessions_mutex_;
  std::map<std::string, util::CancellationToken> sessions_;

  std::mutex  init_mutex_;
  std::thread init_thread_;

  util::CancellationToken shutdown_;
};

} // namespace speechmaker::service
