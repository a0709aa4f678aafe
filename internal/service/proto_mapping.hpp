#pragma once

#include <optional>

#include "speechmaker/v1.hpp"
#include "internal/errors/error_log.hpp"
#include "internal/errors/error_record_proto.hpp"
#include "internal/model/error_record.hpp"
#include "internal/model/output_format.hpp"
#include "internal/model/resource_status.hpp"
#include "internal/model/voice.hpp"
#include "internal/readiness/readiness_state_machine.hpp"

namespace speechmaker::service {

/*
  Conversions between core types and their wire messages.
*/

using errors::ToProto;

speechmaker::v1::Voice             ToProto(const model::Voice& voice);
speechmaker::v1::ResourceStatus    ToProto(const model::ResourceStatus& status);
speechmaker::v1::ReadinessSnapshot ToProto(const readiness::ReadinessSnapshot& snapshot);
speechmaker::v1::ReadinessTopic    ToProto(readiness::Topic topic);
speechmaker::v1::ErrorStatistics   ToProto(const errors::ErrorStatistics& stats);

// UNSPECIFIED yields `fallback`.
model::OutputFormat FromProto(speechmaker::v1::OutputFormat format, model::OutputFormat fallback);
// UNSPECIFIED and unknown values yield nullopt.
std::optional<readiness::Topic> FromProto(speechmaker::v1::ReadinessTopic topic);

} // namespace speechmaker::service
