#include "error_record_proto.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

#include "internal/util/time.hpp"
#include "internal/util/utf8.hpp"

namespace speechmaker::errors {

namespace v1 = speechmaker::v1;

v1::Severity ToProto(model::Severity severity) {
  switch (severity) {
    case model::Severity::kInfo:
      return v1::SEVERITY_INFO;
    case model::Severity::kWarning:
      return v1::SEVERITY_WARNING;
    case model::Severity::kError:
      return v1::SEVERITY_ERROR;
    case model::Severity::kCritical:
      return v1::SEVERITY_CRITICAL;
  }
  return v1::SEVERITY_UNSPECIFIED;
}

v1::ErrorRecord ToProto(const model::ErrorRecord& record) {
  v1::ErrorRecord out;
  out.set_id(record.id);
  out.set_timestamp_ms(util::ToUnixMillis(record.timestamp));
  out.set_category(std::string(model::ToString(record.category)));
  out.set_severity(ToProto(record.severity));
  out.set_user_message(util::ToValidUtf8(record.user_message));
  for (const auto& step : record.troubleshooting) {
    out.add_troubleshooting(util::ToValidUtf8(step));
  }
  out.set_can_retry(record.can_retry);
  out.set_suggested_action(record.suggested_action);
  out.set_code(util::ToValidUtf8(record.code));
  out.set_raw_message(util::ToValidUtf8(record.raw_message));
  out.set_operation(util::ToValidUtf8(record.operation));
  return out;
}

std::string ToJsonLine(const model::ErrorRecord& record) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;

  std::string json;
  const auto  status = google::protobuf::util::MessageToJsonString(ToProto(record), &json, options);
  if (!status.ok()) {
    throw std::runtime_error("Failed to serialize error record " + record.id + ": " + std::string(status.message()));
  }
  return json;
}

} // namespace speechmaker::errors
