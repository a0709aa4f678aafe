#pragma once

#include <string>

namespace speechmaker::model {

struct Voice {
  std::string id;
  std::string display_name;
  std::string locale;
  std::string gender;
  bool        is_default = false;
};

} // namespace speechmaker::model
