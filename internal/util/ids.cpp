#include "ids.hpp"

#include <array>
#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>

#include "internal/util/time.hpp"

namespace speechmaker::util {

namespace {

std::mt19937_64& Rng() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  return rng;
}

} // namespace

std::string GenerateErrorId() {
  static constexpr char kBase36[] = "0123456789abcdefghijklmnopqrstuvwxyz";

  std::string suffix;
  suffix.reserve(9);
  for (int i = 0; i < 9; ++i) {
    suffix.push_back(kBase36[Rng()() % 36]);
  }
  return "err_" + std::to_string(ToUnixMillis(Now())) + "_" + suffix;
}

std::string GenerateSessionId() {
  std::array<uint8_t, 16> id{};
  for (auto& b : id)
    b = static_cast<uint8_t>(Rng()());

  // RFC4122 variant + version 4
  id[6] = (id[6] & 0x0F) | 0x40;
  id[8] = (id[8] & 0x3F) | 0x80;

  std::ostringstream oss;
  for (size_t i = 0; i < id.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) oss << "-";
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(id[i]);
  }
  return oss.str();
}

} // namespace speechmaker::util
