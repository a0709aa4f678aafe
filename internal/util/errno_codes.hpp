#pragma once

#include <string>

namespace speechmaker::util {

// Symbolic name for an errno value ("ENOENT"); unknown values map to "E<value>".
std::string ErrnoName(int value);

} // namespace speechmaker::util
