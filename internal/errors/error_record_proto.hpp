#pragma once

#include <string>

#include "internal/model/error_record.hpp"
#include "speechmaker/v1.hpp"

namespace speechmaker::errors {

/*
  Wire form of an ErrorRecord.

  Shared by RPC responses, gRPC status details and the on-disk error journal.
  Text fields are forced to valid UTF-8 since raw messages carry subprocess
  output.
*/
speechmaker::v1::ErrorRecord ToProto(const model::ErrorRecord& record);
speechmaker::v1::Severity    ToProto(model::Severity severity);

// One-line JSON object with proto field names, as written to the journal.
std::string ToJsonLine(const model::ErrorRecord& record);

} // namespace speechmaker::errors
