#pragma once

#include <string>

namespace speechmaker::util {

/*
  Identifier helpers.

  Error ids follow err_<unix millis>_<9 base36 chars>.
  Session ids are RFC4122 v4 UUID strings.
*/

std::string GenerateErrorId();
std::string GenerateSessionId();

} // namespace speechmaker::util
